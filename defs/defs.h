
//    --------------------------------------------------------------------
//
//    This file is part of Vitaline.
//
//    Vitaline is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Vitaline is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Vitaline. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __DEFS_H__
#define __DEFS_H__

#include <map>
#include <set>
#include <string>
#include <stdint.h>
#include <vector>

#include "param.h"


//
// Closed set of editable signals; labels map onto these once, on the
// way in (see signals/signals.h)
//

enum signal_key_t
  {
    SIG_HR = 0 ,
    SIG_SPO2 ,
    SIG_RR ,
    SIG_ETCO2 ,
    SIG_NBP_SYS ,
    SIG_NBP_DIA ,
    SIG_NBP_MEAN
  };

const int SIG_N = 7;


//
// One sample (or control point): time from the start of the
// timeline (msec), value, and whether the user set it deliberately
//

struct data_point_t
{

  data_point_t() : msec(0) , value(0) , modified(false) { }

  data_point_t( uint64_t msec , double value , bool modified = false )
  : msec(msec) , value(value) , modified(modified) { }

  uint64_t msec;

  double value;

  bool modified;

  bool operator<( const data_point_t & rhs ) const { return msec < rhs.msec; }

  bool operator==( const data_point_t & rhs ) const
  {
    return msec == rhs.msec && value == rhs.value && modified == rhs.modified;
  }

  bool operator!=( const data_point_t & rhs ) const { return ! ( *this == rhs ); }

};


// zoom presets for the per-signal view window

enum zoom_scale_t
  {
    ZOOM_FULL = 0 ,
    ZOOM_5S ,
    ZOOM_30S ,
    ZOOM_5M ,
    ZOOM_10M
  };


struct globals
{

  static std::string version;
  static std::string date;

  // return code for the command-line tool
  static int retcode;


  //
  // Timeline defaults (new store, or after RESET of the whole thing)
  //

  // seconds
  static double default_duration;

  // milliseconds between grid samples
  static int default_sample_rate;

  // import: inferred sample rates are floored at this (ms)
  static int min_import_sample_rate;

  // wall-clock origin for the 'Clock' export column, H:MM
  static std::string clock_start;

  // committed snapshots retained for undo
  static int history_depth;

  // cascade edits into new samples on duration increase
  static bool cascade;

  // a zoom change on one signal applies to all
  static bool zoom_sync;

  // snap control-point values to the signal's step
  static bool snap_values;

  // field delimiter for text export (',' or tab)
  static char csv_delimiter;


  //
  // Output / logging
  //

  static bool silent;

  static bool verbose;

  static bool api_mode;

  // buffer logger output (API mode), see logger_t::print_buffer()
  static bool cache_log;

  static bool write_log;

  static std::string log_file;

  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // otherwise, halt() kills the process
  static bool bail_on_fail;

  // generic global parameters (from the command line)
  static param_t param;

  // global functions: primary initiation of all globals
  void init_defs();

  // library mode: quiet, errors thrown back to the caller
  void api();

  // set from any recognised command-line key=value
  static bool set( const std::string & key , const std::string & value );

  static std::string zoom_label( zoom_scale_t );

  static bool zoom_scale( const std::string & , zoom_scale_t * );

};

#endif

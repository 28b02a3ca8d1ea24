
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

#include "defs/defs.h"

#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;

std::string globals::version;
std::string globals::date;

int globals::retcode;

double globals::default_duration;
int globals::default_sample_rate;
int globals::min_import_sample_rate;
std::string globals::clock_start;
int globals::history_depth;
bool globals::cascade;
bool globals::zoom_sync;
bool globals::snap_values;
char globals::csv_delimiter;

bool globals::silent;
bool globals::verbose;
bool globals::api_mode;
bool globals::cache_log;
bool globals::write_log;
std::string globals::log_file;

void (*globals::bail_function) ( const std::string & );

bool globals::bail_on_fail;

param_t globals::param;


void globals::api()
{
  api_mode = true;
  silent = true;
  cache_log = true;
  bail_on_fail = false;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.9.2";

  date    = "16-Oct-2026";

  retcode = 0;

  //
  // Timeline: 30 minutes at 1 Hz
  //

  default_duration = 30 * 60;

  default_sample_rate = 1000;

  min_import_sample_rate = 1000;

  clock_start = "00:00";

  history_depth = 50;

  cascade = true;

  zoom_sync = false;

  snap_values = false;

  csv_delimiter = ',';

  //
  // Output
  //

  silent = false;

  verbose = false;

  api_mode = false;

  cache_log = false;

  write_log = false;

  log_file = "";

  bail_function = NULL;

  bail_on_fail = true;

  param.clear();

}


bool globals::set( const std::string & key , const std::string & value )
{

  // duration in seconds
  if ( key == "dur" )
    {
      double d = 0;
      if ( ! Helper::str2dbl( value , &d ) || d <= 0 )
	Helper::halt( "bad value for dur: " + value );
      default_duration = d;
      return true;
    }

  // sample rate in msec
  if ( key == "sr" )
    {
      int sr = 0;
      if ( ! Helper::str2int( value , &sr ) || sr < 1 )
	Helper::halt( "bad value for sr (expecting a positive integer, msec): " + value );
      default_sample_rate = sr;
      return true;
    }

  if ( key == "start" )
    {
      int h = 0 , m = 0;
      if ( ! Helper::hhmm( value , &h , &m ) )
	Helper::halt( "bad value for start (expecting H:MM): " + value );
      clock_start = value;
      return true;
    }

  if ( key == "history" )
    {
      int n = 0;
      if ( ! Helper::str2int( value , &n ) || n < 0 )
	Helper::halt( "bad value for history: " + value );
      history_depth = n;
      return true;
    }

  if ( key == "cascade" ) { cascade = Helper::yesno( value ); return true; }

  if ( key == "sync" ) { zoom_sync = Helper::yesno( value ); return true; }

  if ( key == "snap" ) { snap_values = Helper::yesno( value ); return true; }

  if ( key == "silent" ) { silent = Helper::yesno( value ); return true; }

  if ( key == "verbose" ) { verbose = Helper::yesno( value ); return true; }

  if ( key == "log" )
    {
      if ( value == "" || value == "__null__" )
	Helper::halt( "log requires a file name, log=FILE" );
      write_log = true;
      log_file = value;
      return true;
    }

  // tab-delimited export
  if ( key == "tab" )
    {
      csv_delimiter = Helper::yesno( value ) ? '\t' : ',' ;
      return true;
    }

  return false;
}


std::string globals::zoom_label( zoom_scale_t z )
{
  if ( z == ZOOM_5S ) return "5s";
  if ( z == ZOOM_30S ) return "30s";
  if ( z == ZOOM_5M ) return "5m";
  if ( z == ZOOM_10M ) return "10m";
  return "full";
}


bool globals::zoom_scale( const std::string & s , zoom_scale_t * z )
{
  if      ( Helper::iequals( s , "full" ) ) *z = ZOOM_FULL;
  else if ( Helper::iequals( s , "5s" ) ) *z = ZOOM_5S;
  else if ( Helper::iequals( s , "30s" ) ) *z = ZOOM_30S;
  else if ( Helper::iequals( s , "5m" ) ) *z = ZOOM_5M;
  else if ( Helper::iequals( s , "10m" ) ) *z = ZOOM_10M;
  else return false;
  return true;
}

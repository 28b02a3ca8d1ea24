
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


#ifndef __STORE_H__
#define __STORE_H__

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "timeline/timeline.h"
#include "csv/csv.h"


//
// Holds the current timeline snapshot and the undo/redo history.
// Each operation builds a new snapshot from the current one and
// publishes it in one step; a rejected operation publishes nothing
//

struct store_t
{

  // empty timeline from the globals defaults
  store_t();

  explicit store_t( const timeline_t & t );

  const timeline_t & timeline() const { return *current; }

  // shared, immutable; stays valid whatever the store does next
  std::shared_ptr<const timeline_t> snapshot() const { return current; }


  //
  // edits; each returns false (with a warning) if it was rejected
  //

  bool select_signals( const std::vector<signal_key_t> & keys );

  bool initialize_signal( signal_key_t key );

  bool set_duration( double sec );

  bool set_sample_rate( int ms );

  bool add_control_point( signal_key_t key , uint64_t msec , double value );

  bool move_control_point( signal_key_t key , int idx , uint64_t msec , double value );

  bool delete_control_point( signal_key_t key , int idx );

  bool set_sample( signal_key_t key , uint64_t msec , double value );

  bool reset_signal( signal_key_t key );

  bool toggle_visibility( signal_key_t key );

  // view state only: not recorded for undo
  bool set_zoom( signal_key_t key , const zoom_t & zoom );

  bool set_zoom_preset( signal_key_t key , zoom_scale_t scale );


  //
  // history
  //

  bool undo();

  bool redo();

  int undo_size() const { return undo_stack.size(); }

  int redo_size() const { return redo_stack.size(); }


  //
  // options
  //

  void set_cascade( bool b ) { do_cascade = b; }

  bool cascade() const { return do_cascade; }

  void set_zoom_sync( bool b ) { do_sync = b; }

  bool zoom_sync() const { return do_sync; }

  void set_history_depth( int n );


  //
  // CSV
  //

  // all-or-nothing: on failure the timeline is untouched
  bool import_csv( const std::string & filename , std::string * errmsg );

  bool import_csv( const csv_table_t & table , std::string * errmsg );

  std::vector<row_t> export_rows( const std::vector<std::string> & columns ) const;

  bool export_csv( const std::string & filename ,
		   const std::vector<std::string> & columns ,
		   std::string * errmsg ) const;

 private:

  std::shared_ptr<const timeline_t> current;

  std::deque<std::shared_ptr<const timeline_t> > undo_stack;

  std::vector<std::shared_ptr<const timeline_t> > redo_stack;

  int depth;

  bool do_cascade;

  bool do_sync;

  // publish, recording the old snapshot for undo
  void commit( const timeline_t & t );

  // publish without history
  void replace( const timeline_t & t );

  // false (with a warning) if the signal is not there
  bool exists( signal_key_t key ) const;

};

#endif

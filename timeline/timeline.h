
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


#ifndef __TIMELINE_H__
#define __TIMELINE_H__

#include <vector>
#include <string>
#include <map>

#include "defs/defs.h"


//
// Per-signal view window (seconds); view state only, never data
//

struct zoom_t
{

  zoom_t() : scale( ZOOM_FULL ) , start(0) , end(0) { }

  zoom_t( zoom_scale_t scale , double start , double end )
  : scale(scale) , start(start) , end(end) { }

  zoom_scale_t scale;

  double start, end;

  // window width of a preset (dur for 'full')
  static double window( zoom_scale_t scale , double dur );

  // preset window starting at 'start', kept inside [0,dur]
  static zoom_t make( zoom_scale_t scale , double start , double dur );

  // switch to preset 'scale', centred on the current view
  zoom_t preset( zoom_scale_t scale , double dur ) const;

  // preset that best describes a free [start,end] range
  static zoom_scale_t classify( double start , double end );

  // free range, clipped to [0,dur] and classified
  static zoom_t range( double start , double end , double dur );

  // placement snap interval (seconds) at this scale
  static double snap_interval( zoom_scale_t scale );

  static double snap_time( double sec , zoom_scale_t scale );

  bool operator==( const zoom_t & rhs ) const
  {
    return scale == rhs.scale && start == rhs.start && end == rhs.end;
  }

};


//
// Everything held for one signal
//

struct signal_state_t
{

  signal_state_t() : visible( true ) , order( 0 ) { }

  // dense, one point per grid timestamp
  std::vector<data_point_t> data;

  // sparse, user placed, strictly increasing time
  std::vector<data_point_t> cps;

  bool visible;

  // stacking order (1-based, order of creation)
  int order;

  zoom_t zoom;

  bool operator==( const signal_state_t & rhs ) const
  {
    return visible == rhs.visible && order == rhs.order
      && zoom == rhs.zoom && data == rhs.data && cps == rhs.cps;
  }

};


//
// The whole timeline: grid + all signal states.  Every edit is a
// const member returning a new timeline_t; nothing is changed in place
//

struct timeline_t
{

  timeline_t();

  timeline_t( double duration , int sr );

  // seconds
  double duration;

  // msec between samples
  int sr;

  std::map<signal_key_t,signal_state_t> signals;

  // current selection, in the order given
  std::vector<signal_key_t> selected;


  //
  // queries
  //

  bool has( signal_key_t key ) const { return signals.find( key ) != signals.end(); }

  // halts if absent
  const signal_state_t & signal( signal_key_t key ) const;

  // number of grid timestamps
  uint64_t size() const;

  // visible signals, in stacking order
  std::vector<signal_key_t> visible() const;

  int next_order() const;

  // check length / grid / bounds / ordering invariants
  bool check( std::string * errmsg ) const;

  bool operator==( const timeline_t & rhs ) const
  {
    return duration == rhs.duration && sr == rhs.sr
      && selected == rhs.selected && signals == rhs.signals;
  }

  bool operator!=( const timeline_t & rhs ) const { return ! ( *this == rhs ); }


  //
  // transitions
  //

  timeline_t select( const std::vector<signal_key_t> & keys ) const;

  timeline_t initialize( signal_key_t key ) const;

  timeline_t set_duration( double dur , bool cascade ) const;

  timeline_t set_sample_rate( int sr ) const;

  timeline_t add_control_point( signal_key_t key , const data_point_t & p ) const;

  timeline_t move_control_point( signal_key_t key , int idx , const data_point_t & p ) const;

  timeline_t delete_control_point( signal_key_t key , int idx ) const;

  timeline_t set_sample( signal_key_t key , uint64_t msec , double value ) const;

  timeline_t reset( signal_key_t key ) const;

  timeline_t toggle( signal_key_t key ) const;

  timeline_t set_zoom( signal_key_t key , const zoom_t & zoom , bool sync ) const;

 private:

  signal_state_t make_state( signal_key_t key , int order ) const;

  // clamp to [0,duration] x [min,max]; control points keep no flag
  data_point_t clamp_point( signal_key_t key , const data_point_t & p ) const;

  // insert into sorted control points, replacing any at the same time
  static void insert_point( std::vector<data_point_t> * cps , const data_point_t & p );

  void regenerate( signal_key_t key , signal_state_t * s ) const;

};


#endif

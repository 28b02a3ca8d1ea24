
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


#include "timeline/timeline.h"
#include "timeline/grid.h"

#include "signals/signals.h"
#include "dsp/cpinterp.h"
#include "dsp/resample.h"
#include "helper/helper.h"

#include <algorithm>
#include <cmath>


//
// zoom_t
//

double zoom_t::window( zoom_scale_t scale , double dur )
{
  switch ( scale )
    {
    case ZOOM_5S  : return 4;
    case ZOOM_30S : return 30;
    case ZOOM_5M  : return 300;
    case ZOOM_10M : return 600;
    default       : return dur;
    }
}


zoom_t zoom_t::make( zoom_scale_t scale , double start , double dur )
{
  if ( scale == ZOOM_FULL ) return zoom_t( ZOOM_FULL , 0 , dur );
  const double w = window( scale , dur );
  if ( start + w > dur ) start = dur - w;
  if ( start < 0 ) start = 0;
  return zoom_t( scale , start , std::min( start + w , dur ) );
}


zoom_t zoom_t::preset( zoom_scale_t s , double dur ) const
{
  if ( s == ZOOM_FULL ) return zoom_t( ZOOM_FULL , 0 , dur );
  const double centre = ( start + end ) / 2.0;
  return make( s , centre - window( s , dur ) / 2.0 , dur );
}


zoom_scale_t zoom_t::classify( double start , double end )
{
  const double w = end - start;
  if ( w <= 7 ) return ZOOM_5S;
  if ( w <= 60 ) return ZOOM_30S;
  if ( w <= 360 ) return ZOOM_5M;
  if ( w <= 720 ) return ZOOM_10M;
  return ZOOM_FULL;
}


zoom_t zoom_t::range( double start , double end , double dur )
{
  if ( start < 0 ) start = 0;
  if ( end > dur ) end = dur;
  if ( end < start ) end = start;
  const zoom_scale_t s = classify( start , end );
  if ( s == ZOOM_FULL ) return zoom_t( ZOOM_FULL , 0 , dur );
  return zoom_t( s , start , end );
}


double zoom_t::snap_interval( zoom_scale_t scale )
{
  switch ( scale )
    {
    case ZOOM_5S  : return 1;
    case ZOOM_30S : return 5;
    case ZOOM_5M  : return 30;
    default       : return 60;
    }
}


double zoom_t::snap_time( double sec , zoom_scale_t scale )
{
  const double i = snap_interval( scale );
  return std::floor( sec / i + 0.5 ) * i;
}



//
// timeline_t
//

timeline_t::timeline_t()
  : duration( globals::default_duration ) , sr( globals::default_sample_rate )
{ }


timeline_t::timeline_t( double duration , int sr )
  : duration( duration ) , sr( sr )
{ }


const signal_state_t & timeline_t::signal( signal_key_t key ) const
{
  std::map<signal_key_t,signal_state_t>::const_iterator ss = signals.find( key );
  if ( ss == signals.end() )
    {
      Helper::halt( "signal " + signal_registry_t::label( key ) + " has not been created" );
      static const signal_state_t empty;
      return empty;
    }
  return ss->second;
}


uint64_t timeline_t::size() const
{
  return grid::size( duration , sr );
}


std::vector<signal_key_t> timeline_t::visible() const
{
  std::map<int,signal_key_t> o;
  std::map<signal_key_t,signal_state_t>::const_iterator ss = signals.begin();
  while ( ss != signals.end() )
    {
      if ( ss->second.visible ) o[ ss->second.order ] = ss->first;
      ++ss;
    }

  std::vector<signal_key_t> r;
  std::map<int,signal_key_t>::const_iterator oo = o.begin();
  while ( oo != o.end() )
    {
      r.push_back( oo->second );
      ++oo;
    }
  return r;
}


int timeline_t::next_order() const
{
  int mx = 0;
  std::map<signal_key_t,signal_state_t>::const_iterator ss = signals.begin();
  while ( ss != signals.end() )
    {
      if ( ss->second.order > mx ) mx = ss->second.order;
      ++ss;
    }
  return mx + 1;
}


bool timeline_t::check( std::string * errmsg ) const
{

  const uint64_t n = size();

  const uint64_t tmax = grid::duration_msec( duration );

  std::map<signal_key_t,signal_state_t>::const_iterator ss = signals.begin();

  while ( ss != signals.end() )
    {

      const signal_def_t & def = signal_registry_t::def( ss->first );

      const std::vector<data_point_t> & d = ss->second.data;

      if ( d.size() != n )
	{
	  *errmsg = def.label + " has " + Helper::int2str( (uint64_t)d.size() )
	    + " samples, expecting " + Helper::int2str( n );
	  return false;
	}

      for (uint64_t i=0; i<n; i++)
	{
	  if ( d[i].msec != grid::msec( i , sr ) )
	    {
	      *errmsg = def.label + " sample " + Helper::int2str( i ) + " is off the grid";
	      return false;
	    }
	  if ( d[i].value < def.pmin || d[i].value > def.pmax )
	    {
	      *errmsg = def.label + " sample " + Helper::int2str( i ) + " is out of range";
	      return false;
	    }
	}

      const std::vector<data_point_t> & cps = ss->second.cps;
      for (int j=0; j<cps.size(); j++)
	{
	  if ( j != 0 && cps[j].msec <= cps[j-1].msec )
	    {
	      *errmsg = def.label + " control points are not strictly increasing";
	      return false;
	    }
	  if ( cps[j].msec > tmax || cps[j].value < def.pmin || cps[j].value > def.pmax )
	    {
	      *errmsg = def.label + " control point " + Helper::int2str( j ) + " is out of range";
	      return false;
	    }
	}

      ++ss;
    }

  return true;
}


signal_state_t timeline_t::make_state( signal_key_t key , int order ) const
{
  signal_state_t s;
  s.data = dsptools::baseline( duration , sr , signal_registry_t::def( key ) );
  s.visible = true;
  s.order = order;
  s.zoom = zoom_t( ZOOM_FULL , 0 , duration );
  return s;
}


data_point_t timeline_t::clamp_point( signal_key_t key , const data_point_t & p ) const
{
  const uint64_t tmax = grid::duration_msec( duration );
  return data_point_t( p.msec > tmax ? tmax : p.msec ,
		       signal_registry_t::def( key ).clamp( p.value ) ,
		       true );
}


void timeline_t::insert_point( std::vector<data_point_t> * cps , const data_point_t & p )
{
  std::vector<data_point_t>::iterator ii = std::lower_bound( cps->begin() , cps->end() , p );
  if ( ii != cps->end() && ii->msec == p.msec )
    *ii = p;
  else
    cps->insert( ii , p );
}


void timeline_t::regenerate( signal_key_t key , signal_state_t * s ) const
{
  s->data = dsptools::regenerate( s->cps , duration , sr , signal_registry_t::def( key ) );
}


timeline_t timeline_t::select( const std::vector<signal_key_t> & keys0 ) const
{

  timeline_t t = *this;

  // drop repeats, keep first-given order
  std::vector<signal_key_t> keys;
  for (int i=0; i<keys0.size(); i++)
    if ( std::find( keys.begin() , keys.end() , keys0[i] ) == keys.end() )
      keys.push_back( keys0[i] );

  int order = next_order();

  for (int i=0; i<keys.size(); i++)
    {
      const signal_key_t k = keys[i];

      // already selected: leave as is
      if ( std::find( selected.begin() , selected.end() , k ) != selected.end() ) continue;

      if ( ! t.has( k ) )
	t.signals[ k ] = make_state( k , order++ );
      else
	t.signals[ k ].visible = true;
    }

  // hide, but keep, anything deselected
  for (int i=0; i<selected.size(); i++)
    if ( std::find( keys.begin() , keys.end() , selected[i] ) == keys.end() && t.has( selected[i] ) )
      t.signals[ selected[i] ].visible = false;

  t.selected = keys;

  return t;
}


timeline_t timeline_t::initialize( signal_key_t key ) const
{
  if ( has( key ) ) return *this;
  timeline_t t = *this;
  t.signals[ key ] = make_state( key , next_order() );
  return t;
}


timeline_t timeline_t::set_duration( double dur , bool cascade ) const
{

  timeline_t t = *this;

  t.duration = dur;

  const uint64_t tmax = grid::duration_msec( dur );

  std::map<signal_key_t,signal_state_t>::iterator ss = t.signals.begin();
  while ( ss != t.signals.end() )
    {
      signal_state_t & s = ss->second;

      s.data = dsptools::resample_duration( s.data , dur , sr , signal_registry_t::def( ss->first ) , cascade );

      // control points past the new end go
      std::vector<data_point_t> cps;
      for (int j=0; j<s.cps.size(); j++)
	if ( s.cps[j].msec <= tmax ) cps.push_back( s.cps[j] );
      s.cps = cps;

      s.zoom = zoom_t::make( s.zoom.scale , s.zoom.start , dur );

      ++ss;
    }

  return t;
}


timeline_t timeline_t::set_sample_rate( int rate ) const
{

  timeline_t t = *this;

  t.sr = rate;

  std::map<signal_key_t,signal_state_t>::iterator ss = t.signals.begin();
  while ( ss != t.signals.end() )
    {
      ss->second.data = dsptools::resample_rate( ss->second.data , duration , rate , signal_registry_t::def( ss->first ) );
      ++ss;
    }

  return t;
}


timeline_t timeline_t::add_control_point( signal_key_t key , const data_point_t & p ) const
{
  if ( ! has( key ) ) return *this;
  timeline_t t = *this;
  signal_state_t & s = t.signals[ key ];
  insert_point( &s.cps , clamp_point( key , p ) );
  regenerate( key , &s );
  return t;
}


timeline_t timeline_t::move_control_point( signal_key_t key , int idx , const data_point_t & p ) const
{
  if ( ! has( key ) ) return *this;
  if ( idx < 0 || idx >= signal( key ).cps.size() ) return *this;
  timeline_t t = *this;
  signal_state_t & s = t.signals[ key ];
  s.cps.erase( s.cps.begin() + idx );
  insert_point( &s.cps , clamp_point( key , p ) );
  regenerate( key , &s );
  return t;
}


timeline_t timeline_t::delete_control_point( signal_key_t key , int idx ) const
{
  if ( ! has( key ) ) return *this;
  if ( idx < 0 || idx >= signal( key ).cps.size() ) return *this;
  timeline_t t = *this;
  signal_state_t & s = t.signals[ key ];
  s.cps.erase( s.cps.begin() + idx );
  regenerate( key , &s );
  return t;
}


timeline_t timeline_t::set_sample( signal_key_t key , uint64_t msec , double value ) const
{
  if ( ! has( key ) ) return *this;
  timeline_t t = *this;
  signal_state_t & s = t.signals[ key ];
  const uint64_t i = grid::nearest( msec , duration , sr );
  s.data[i].value = signal_registry_t::def( key ).clamp( value );
  s.data[i].modified = true;
  return t;
}


timeline_t timeline_t::reset( signal_key_t key ) const
{
  if ( ! has( key ) ) return *this;
  timeline_t t = *this;
  signal_state_t & s = t.signals[ key ];
  s.cps.clear();
  s.data = dsptools::baseline( duration , sr , signal_registry_t::def( key ) );
  return t;
}


timeline_t timeline_t::toggle( signal_key_t key ) const
{
  if ( ! has( key ) ) return *this;
  timeline_t t = *this;
  t.signals[ key ].visible = ! t.signals[ key ].visible;
  return t;
}


timeline_t timeline_t::set_zoom( signal_key_t key , const zoom_t & zoom , bool sync ) const
{
  if ( ! has( key ) ) return *this;
  timeline_t t = *this;
  if ( sync )
    {
      std::map<signal_key_t,signal_state_t>::iterator ss = t.signals.begin();
      while ( ss != t.signals.end() )
	{
	  ss->second.zoom = zoom;
	  ++ss;
	}
    }
  else
    t.signals[ key ].zoom = zoom;
  return t;
}

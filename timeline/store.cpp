
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


#include "timeline/store.h"
#include "timeline/grid.h"

#include "signals/signals.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


store_t::store_t()
  : current( std::make_shared<const timeline_t>() ) ,
    depth( globals::history_depth ) ,
    do_cascade( globals::cascade ) ,
    do_sync( globals::zoom_sync )
{ }


store_t::store_t( const timeline_t & t )
  : current( std::make_shared<const timeline_t>( t ) ) ,
    depth( globals::history_depth ) ,
    do_cascade( globals::cascade ) ,
    do_sync( globals::zoom_sync )
{ }


void store_t::commit( const timeline_t & t )
{
  // nothing changed, nothing to record
  if ( t == *current ) return;

  if ( depth > 0 )
    {
      undo_stack.push_back( current );
      while ( undo_stack.size() > depth ) undo_stack.pop_front();
    }

  redo_stack.clear();

  current = std::make_shared<const timeline_t>( t );
}


void store_t::replace( const timeline_t & t )
{
  current = std::make_shared<const timeline_t>( t );
}


bool store_t::exists( signal_key_t key ) const
{
  if ( current->has( key ) ) return true;
  Helper::warn( signal_registry_t::label( key ) + " has not been selected or initialized" );
  return false;
}


void store_t::set_history_depth( int n )
{
  depth = n < 0 ? 0 : n ;
  while ( undo_stack.size() > depth ) undo_stack.pop_front();
}


bool store_t::select_signals( const std::vector<signal_key_t> & keys )
{
  commit( current->select( keys ) );
  return true;
}


bool store_t::initialize_signal( signal_key_t key )
{
  commit( current->initialize( key ) );
  return true;
}


bool store_t::set_duration( double sec )
{
  std::string errmsg;
  if ( ! grid::valid( sec , current->sr , &errmsg ) )
    {
      Helper::warn( errmsg );
      return false;
    }
  commit( current->set_duration( sec , do_cascade ) );
  return true;
}


bool store_t::set_sample_rate( int ms )
{
  std::string errmsg;
  if ( ! grid::valid( current->duration , ms , &errmsg ) )
    {
      Helper::warn( errmsg );
      return false;
    }
  commit( current->set_sample_rate( ms ) );
  return true;
}


bool store_t::add_control_point( signal_key_t key , uint64_t msec , double value )
{
  if ( ! exists( key ) ) return false;
  if ( std::isnan( value ) )
    {
      Helper::warn( "control point value is not a number" );
      return false;
    }
  commit( current->add_control_point( key , data_point_t( msec , value , true ) ) );
  return true;
}


bool store_t::move_control_point( signal_key_t key , int idx , uint64_t msec , double value )
{
  if ( ! exists( key ) ) return false;
  if ( idx < 0 || idx >= current->signal( key ).cps.size() )
    {
      Helper::warn( "no control point " + Helper::int2str( idx ) + " for " + signal_registry_t::label( key ) );
      return false;
    }
  if ( std::isnan( value ) )
    {
      Helper::warn( "control point value is not a number" );
      return false;
    }
  commit( current->move_control_point( key , idx , data_point_t( msec , value , true ) ) );
  return true;
}


bool store_t::delete_control_point( signal_key_t key , int idx )
{
  if ( ! exists( key ) ) return false;
  if ( idx < 0 || idx >= current->signal( key ).cps.size() )
    {
      Helper::warn( "no control point " + Helper::int2str( idx ) + " for " + signal_registry_t::label( key ) );
      return false;
    }
  commit( current->delete_control_point( key , idx ) );
  return true;
}


bool store_t::set_sample( signal_key_t key , uint64_t msec , double value )
{
  if ( ! exists( key ) ) return false;
  if ( std::isnan( value ) )
    {
      Helper::warn( "sample value is not a number" );
      return false;
    }
  commit( current->set_sample( key , msec , value ) );
  return true;
}


bool store_t::reset_signal( signal_key_t key )
{
  if ( ! exists( key ) ) return false;
  commit( current->reset( key ) );
  return true;
}


bool store_t::toggle_visibility( signal_key_t key )
{
  if ( ! exists( key ) ) return false;
  commit( current->toggle( key ) );
  return true;
}


bool store_t::set_zoom( signal_key_t key , const zoom_t & zoom )
{
  if ( ! exists( key ) ) return false;
  replace( current->set_zoom( key , zoom , do_sync ) );
  return true;
}


bool store_t::set_zoom_preset( signal_key_t key , zoom_scale_t scale )
{
  if ( ! exists( key ) ) return false;
  const zoom_t z = current->signal( key ).zoom.preset( scale , current->duration );
  replace( current->set_zoom( key , z , do_sync ) );
  return true;
}


bool store_t::undo()
{
  if ( undo_stack.size() == 0 ) return false;
  redo_stack.push_back( current );
  current = undo_stack.back();
  undo_stack.pop_back();
  return true;
}


bool store_t::redo()
{
  if ( redo_stack.size() == 0 ) return false;
  undo_stack.push_back( current );
  current = redo_stack.back();
  redo_stack.pop_back();
  return true;
}


bool store_t::import_csv( const csv_table_t & table , std::string * errmsg )
{

  timeline_t staged;

  if ( ! csv::import( table , *current , &staged , errmsg ) )
    return false;

  commit( staged );

  logger << "  imported " << staged.selected.size() << " signal(s), "
	 << staged.size() << " samples per signal ("
	 << staged.duration << "s at " << staged.sr << "ms)\n";

  return true;
}


bool store_t::import_csv( const std::string & filename , std::string * errmsg )
{
  csv_table_t table;
  if ( ! csv::read( filename , &table , errmsg ) ) return false;
  return import_csv( table , errmsg );
}


std::vector<row_t> store_t::export_rows( const std::vector<std::string> & columns ) const
{
  return csv::export_rows( *current , columns );
}


bool store_t::export_csv( const std::string & filename ,
			  const std::vector<std::string> & columns ,
			  std::string * errmsg ) const
{
  const std::string text = csv::to_csv( columns , export_rows( columns ) , globals::csv_delimiter );
  return csv::write( filename , text , errmsg );
}


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


#include "signals/signals.h"

#include "helper/helper.h"

#include <cmath>


double signal_def_t::snap( double x ) const
{
  if ( ! has_step ) return clamp( x );
  return clamp( std::floor( x / step + 0.5 ) * step );
}


//
// the table; bounds, baselines and steps are those of the monitor
// export format, soft bands are adult normal ranges
//

static const std::vector<signal_def_t> & table()
{
  static const std::vector<signal_def_t> t = {
    //            key            label         unit     min  max  dflt step  soft band
    signal_def_t( SIG_HR       , "HR"        , "bpm"  ,   0 , 220 ,  70 , 1 ,  60 , 100 ) ,
    signal_def_t( SIG_SPO2     , "SpO2"      , "%"    ,  50 , 100 ,  98 , 1 ,  95 , 100 ) ,
    signal_def_t( SIG_RR       , "RR"        , "bpm"  ,   0 ,  60 ,  14 , 1 ,  12 ,  20 ) ,
    signal_def_t( SIG_ETCO2    , "etCO2"     , "mmHg" ,   0 ,  80 ,  35 , 1 ,  35 ,  45 ) ,
    signal_def_t( SIG_NBP_SYS  , "NBP (Sys)" , "mmHg" ,  50 , 220 , 120 , 1 ,  90 , 140 ) ,
    signal_def_t( SIG_NBP_DIA  , "NBP (Dia)" , "mmHg" ,  30 , 140 ,  75 , 1 ,  60 ,  90 ) ,
    signal_def_t( SIG_NBP_MEAN , "NBP (Mean)", "mmHg" ,  40 , 180 ,  90 , 1 ,  70 , 105 )
  };
  return t;
}


const signal_def_t & signal_registry_t::def( signal_key_t key )
{
  const std::vector<signal_def_t> & t = table();
  if ( (int)key < 0 || (int)key >= (int)t.size() )
    {
      Helper::halt( "internal error: bad signal key " + Helper::int2str( (int)key ) );
      return t[0];
    }
  return t[ key ];
}


const std::string & signal_registry_t::label( signal_key_t key )
{
  return def( key ).label;
}


bool signal_registry_t::lookup( const std::string & label , signal_key_t * key )
{
  const std::string l = Helper::lrtrim( label );
  const std::vector<signal_def_t> & t = table();
  for (int i=0; i<t.size(); i++)
    if ( Helper::iequals( t[i].label , l ) )
      {
	*key = t[i].key;
	return true;
      }
  return false;
}


signal_key_t signal_registry_t::key( const std::string & label )
{
  signal_key_t k = SIG_HR;
  if ( ! lookup( label , &k ) )
    Helper::halt( "unrecognized signal: " + label );
  return k;
}


std::vector<signal_key_t> signal_registry_t::all()
{
  std::vector<signal_key_t> k;
  for (int i=0; i<SIG_N; i++) k.push_back( (signal_key_t)i );
  return k;
}


std::vector<signal_key_t> signal_registry_t::default_active()
{
  std::vector<signal_key_t> k;
  k.push_back( SIG_HR );
  k.push_back( SIG_SPO2 );
  k.push_back( SIG_RR );
  k.push_back( SIG_ETCO2 );
  return k;
}


const std::vector<std::string> & signal_registry_t::required_columns()
{
  static const std::vector<std::string> r = { "Time" , "RelativeTimeMilliseconds" , "Clock" };
  return r;
}


const std::vector<std::string> & signal_registry_t::headers()
{
  static const std::vector<std::string> h = {
    "Time", "RelativeTimeMilliseconds", "Clock",
    "HR", "ST-II", "Pulse", "SpO2", "Perf",
    "etCO2", "imCO2", "awRR",
    "NBP (Sys)", "NBP (Dia)", "NBP (Mean)", "NBP (Pulse)", "NBP (Time Remaining)",
    "ART (Sys)", "ART (Dia)", "ART (Mean)",
    "etDES", "inDES", "etISO", "inISO", "etSEV", "inSEV", "etN2O", "inN2O",
    "MAC", "etO2", "inO2", "Temp",
    "BIS", "SQI", "EMG",
    "Tidal Volume", "Minute Volume", "RR",
    "Set Tidal Volume", "Set RR", "Set I:E Ratio", "Set PEEP",
    "Set PAWmax", "Set PAWmin", "Set Mechanical Ventilation",
    "Tidal Volume Exp (Spiro)", "Tidal Volume In (Spiro)",
    "Minute Volume Exp (Spiro)", "Minute Volume In (Spiro)",
    "Lung Compliance (Spiro)", "Airway Resistance (Spiro)",
    "Max Inspiratory Pressure (Spiro)",
    "Num Patient Alarms", "Num Technical Alarms"
  };
  return h;
}


bool signal_registry_t::is_header( const std::string & h )
{
  const std::vector<std::string> & hh = headers();
  for (int i=0; i<hh.size(); i++)
    if ( Helper::iequals( hh[i] , h ) ) return true;
  return false;
}


bool signal_registry_t::is_required( const std::string & h )
{
  const std::vector<std::string> & r = required_columns();
  for (int i=0; i<r.size(); i++)
    if ( Helper::iequals( r[i] , h ) ) return true;
  return false;
}

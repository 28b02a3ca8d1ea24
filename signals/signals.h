
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


#ifndef __SIGNALS_H__
#define __SIGNALS_H__

#include "defs/defs.h"

#include <string>
#include <vector>


//
// Definition of one editable signal: physical bounds, baseline,
// snapping step and an optional normal-range ('soft') band
//

struct signal_def_t
{

  signal_def_t( signal_key_t key ,
		const std::string & label ,
		const std::string & unit ,
		double pmin , double pmax , double dflt ,
		double step ,
		double soft_low , double soft_high )
  : key(key) , label(label) , unit(unit) ,
    pmin(pmin) , pmax(pmax) , dflt(dflt) ,
    has_step( step > 0 ) , step( step ) ,
    has_soft( soft_low <= soft_high ) , soft_low( soft_low ) , soft_high( soft_high )
  { }

  signal_key_t key;

  // as written in CSV headers
  std::string label;

  std::string unit;

  double pmin, pmax;

  // baseline
  double dflt;

  bool has_step;
  double step;

  bool has_soft;
  double soft_low, soft_high;

  double clamp( double x ) const
  {
    if ( x < pmin ) return pmin;
    if ( x > pmax ) return pmax;
    return x;
  }

  // nearest multiple of step (if any), still within bounds
  double snap( double x ) const;

  bool in_soft_band( double x ) const
  {
    return has_soft && x >= soft_low && x <= soft_high;
  }

};


//
// Static lookup over the closed set of signals, plus the monitor
// export header catalog
//

struct signal_registry_t
{

  static const signal_def_t & def( signal_key_t key );

  static const std::string & label( signal_key_t key );

  // case-insensitive exact label match
  static bool lookup( const std::string & label , signal_key_t * key );

  // as above, but halts on an unknown label
  static signal_key_t key( const std::string & label );

  // all keys, in enum order
  static std::vector<signal_key_t> all();

  static std::vector<signal_key_t> default_active();

  // Time, RelativeTimeMilliseconds, Clock
  static const std::vector<std::string> & required_columns();

  // full monitor export header set, in export order
  static const std::vector<std::string> & headers();

  static bool is_header( const std::string & h );

  static bool is_required( const std::string & h );

};


#endif

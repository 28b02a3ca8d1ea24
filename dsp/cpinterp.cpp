
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


#include "dsp/cpinterp.h"

#include "signals/signals.h"
#include "timeline/grid.h"

#include <algorithm>


double dsptools::interpolate( const std::vector<data_point_t> & cp , uint64_t t , double dflt )
{

  const int n = cp.size();

  if ( n == 0 ) return dflt;

  if ( n == 1 ) return cp[0].value;

  // hold outside the control points
  if ( t <= cp[0].msec ) return cp[0].value;
  if ( t >= cp[n-1].msec ) return cp[n-1].value;

  // first point strictly after t: (p1,p2] brackets t
  std::vector<data_point_t>::const_iterator p2 =
    std::upper_bound( cp.begin() , cp.end() , data_point_t( t , 0 ) );

  std::vector<data_point_t>::const_iterator p1 = p2 - 1;

  // exact hit returns the stored value, untouched by arithmetic
  if ( p1->msec == t ) return p1->value;

  const double span = (double)p2->msec - (double)p1->msec;

  return p1->value + ( p2->value - p1->value ) * ( (double)t - (double)p1->msec ) / span;
}


std::vector<data_point_t> dsptools::baseline( double dur , int sr , const signal_def_t & def )
{
  const uint64_t n = grid::size( dur , sr );
  std::vector<data_point_t> d( n );
  for (uint64_t i=0; i<n; i++)
    d[i] = data_point_t( grid::msec( i , sr ) , def.dflt , false );
  return d;
}


std::vector<data_point_t> dsptools::regenerate( const std::vector<data_point_t> & cp ,
						double dur , int sr ,
						const signal_def_t & def )
{

  const uint64_t n = grid::size( dur , sr );

  std::vector<data_point_t> d( n );

  for (uint64_t i=0; i<n; i++)
    {
      const uint64_t t = grid::msec( i , sr );
      d[i] = data_point_t( t , def.clamp( interpolate( cp , t , def.dflt ) ) , false );
    }

  for (int j=0; j<cp.size(); j++)
    d[ grid::nearest( cp[j].msec , dur , sr ) ].modified = true;

  return d;
}

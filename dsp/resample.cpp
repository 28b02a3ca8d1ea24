
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


#include "dsp/resample.h"
#include "dsp/cascade.h"

#include "signals/signals.h"
#include "timeline/grid.h"
#include "helper/helper.h"

#include <algorithm>


std::vector<data_point_t> dsptools::resample_duration( const std::vector<data_point_t> & d ,
						       double dur , int sr ,
						       const signal_def_t & def ,
						       bool cascade )
{

  const uint64_t n = grid::size( dur , sr );

  std::vector<data_point_t> r( n );

  for (uint64_t i=0; i<n; i++)
    {
      const uint64_t t = grid::msec( i , sr );
      std::vector<data_point_t>::const_iterator ii =
	std::lower_bound( d.begin() , d.end() , data_point_t( t , 0 ) );
      if ( ii != d.end() && ii->msec == t )
	r[i] = *ii;
      else
	r[i] = data_point_t( t , def.dflt , false );
    }

  //
  // cascade into the new tail
  //

  if ( cascade && d.size() != 0 && r.size() != 0 )
    {
      const uint64_t prev_max = d[ d.size() - 1 ].msec;
      if ( r[ r.size() - 1 ].msec > prev_max )
	dsptools::cascade( &r , prev_max , def );
    }

  return r;
}


std::vector<data_point_t> dsptools::resample_rate( const std::vector<data_point_t> & d ,
						   double dur , int sr ,
						   const signal_def_t & def )
{

  const uint64_t n = grid::size( dur , sr );

  std::vector<data_point_t> r( n );

  for (uint64_t i=0; i<n; i++)
    {

      const uint64_t t = grid::msec( i , sr );

      // first sample at or after t
      std::vector<data_point_t>::const_iterator ii =
	std::lower_bound( d.begin() , d.end() , data_point_t( t , 0 ) );

      if ( ii != d.end() && ii->msec == t )
	{
	  r[i] = *ii;
	  continue;
	}

      const bool has_before = ii != d.begin();
      const bool has_after = ii != d.end();

      if ( has_before && has_after )
	{
	  const data_point_t & p1 = *(ii-1);
	  const data_point_t & p2 = *ii;
	  const double v = p1.value + ( p2.value - p1.value )
	    * ( (double)t - (double)p1.msec ) / ( (double)p2.msec - (double)p1.msec );
	  r[i] = data_point_t( t , def.clamp( v ) , p1.modified || p2.modified );
	}
      else if ( has_before )
	{
	  const data_point_t & p1 = *(ii-1);
	  r[i] = data_point_t( t , def.clamp( p1.value ) , p1.modified );
	}
      else if ( has_after )
	r[i] = data_point_t( t , def.clamp( ii->value ) , ii->modified );
      else
	r[i] = data_point_t( t , def.dflt , false );

    }

  return r;
}

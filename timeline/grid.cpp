
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


#include "timeline/grid.h"

#include "helper/helper.h"

#include <cmath>


uint64_t grid::duration_msec( double dur )
{
  if ( dur <= 0 ) return 0;
  // tolerate representation error, e.g. 0.3 * 1000 = 299.99999...
  return (uint64_t)std::floor( dur * 1000.0 + 1e-6 );
}


uint64_t grid::sample_count( double dur , int sr )
{
  if ( sr <= 0 ) return 0;
  return duration_msec( dur ) / (uint64_t)sr;
}


uint64_t grid::size( double dur , int sr )
{
  return sample_count( dur , sr ) + 1;
}


uint64_t grid::last_msec( double dur , int sr )
{
  return msec( sample_count( dur , sr ) , sr );
}


int64_t grid::index( uint64_t t , int sr )
{
  if ( sr <= 0 ) return -1;
  if ( t % (uint64_t)sr ) return -1;
  return t / (uint64_t)sr;
}


uint64_t grid::nearest( uint64_t t , double dur , int sr )
{
  if ( sr <= 0 ) return 0;
  uint64_t i = ( t + (uint64_t)sr / 2 ) / (uint64_t)sr;
  const uint64_t n = sample_count( dur , sr );
  return i > n ? n : i ;
}


bool grid::valid( double dur , int sr , std::string * errmsg )
{

  if ( ! ( dur > 0 ) || dur > 1e9 )
    {
      *errmsg = "duration must be a positive number of seconds";
      return false;
    }

  if ( sr <= 0 )
    {
      *errmsg = "sample rate must be a positive number of milliseconds";
      return false;
    }

  if ( size( dur , sr ) > MAX_SAMPLES )
    {
      *errmsg = "too many samples ("
	+ Helper::int2str( size( dur , sr ) ) + ") for duration "
	+ Helper::dbl2str( dur ) + "s at " + Helper::int2str( sr ) + "ms";
      return false;
    }

  return true;
}

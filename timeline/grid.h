
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


#ifndef __GRID_H__
#define __GRID_H__

#include <stdint.h>
#include <string>


//
// The sample grid shared by every signal: timestamps 0, sr, 2*sr, ...
// up to the duration; all other code goes through these
//

namespace grid
{

  // largest number of samples per signal we will build
  const uint64_t MAX_SAMPLES = 10000000;

  // whole msec in 'dur' seconds
  uint64_t duration_msec( double dur );

  // floor( dur * 1000 / sr )
  uint64_t sample_count( double dur , int sr );

  // sample_count() + 1, i.e. number of grid timestamps
  uint64_t size( double dur , int sr );

  // timestamp of sample 'i'
  inline uint64_t msec( uint64_t i , int sr ) { return i * (uint64_t)sr; }

  // timestamp of the final sample
  uint64_t last_msec( double dur , int sr );

  // exact grid index for 't', or -1
  int64_t index( uint64_t t , int sr );

  // nearest grid index for 't', within [0, sample_count]
  uint64_t nearest( uint64_t t , double dur , int sr );

  // false (with a reason) if the grid cannot be built
  bool valid( double dur , int sr , std::string * errmsg );

}

#endif

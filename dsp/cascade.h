
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


#ifndef __CASCADE_H__
#define __CASCADE_H__

#include <vector>

#include "defs/defs.h"

struct signal_def_t;

namespace dsptools
{

  // after a duration increase: offset every unmodified sample beyond
  // 'prev_max' by (last modified value - baseline), clamped; returns
  // the number of samples changed
  int cascade( std::vector<data_point_t> * d , uint64_t prev_max , const signal_def_t & def );

}

#endif

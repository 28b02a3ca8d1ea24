
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


#ifndef __CPINTERP_H__
#define __CPINTERP_H__

#include <vector>

#include "defs/defs.h"

struct signal_def_t;

namespace dsptools
{

  // value at 't' from time-ordered control points: linear between
  // bracketing points, held flat outside them, 'dflt' if there are none
  double interpolate( const std::vector<data_point_t> & cp , uint64_t t , double dflt );

  // dense grid samples for (dur, sr) from the control points; the grid
  // sample nearest each control point is flagged as modified
  std::vector<data_point_t> regenerate( const std::vector<data_point_t> & cp ,
					double dur , int sr ,
					const signal_def_t & def );

  // constant baseline at def.dflt
  std::vector<data_point_t> baseline( double dur , int sr , const signal_def_t & def );

}

#endif

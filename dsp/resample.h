
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


#ifndef __RESAMPLE_H__
#define __RESAMPLE_H__

#include <vector>
#include <string>

#include "defs/defs.h"

struct signal_def_t;

namespace dsptools
{

  // extend/truncate onto a grid of new duration 'dur' (same 'sr');
  // exact-timestamp samples are copied, new ones are baseline; if
  // 'cascade' is set and the grid grew, trailing samples are cascaded
  std::vector<data_point_t> resample_duration( const std::vector<data_point_t> & d ,
					       double dur , int sr ,
					       const signal_def_t & def ,
					       bool cascade = true );

  // onto a grid of new rate 'sr' (same 'dur'): exact matches are
  // copied, otherwise linear between the nearest samples strictly
  // either side (held at the ends, baseline if there are none);
  // 'd' need only be time-ordered, not on any grid
  std::vector<data_point_t> resample_rate( const std::vector<data_point_t> & d ,
					   double dur , int sr ,
					   const signal_def_t & def );

}

#endif

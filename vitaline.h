
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


#ifndef __VITALINE_H__
#define __VITALINE_H__

#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <vector>
#include <string>
#include <map>
#include <set>
#include <cmath>

#include "defs/defs.h"
#include "param.h"
#include "eval.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/zfile.h"

#include "signals/signals.h"

#include "timeline/grid.h"
#include "timeline/timeline.h"
#include "timeline/store.h"

#include "dsp/cpinterp.h"
#include "dsp/resample.h"
#include "dsp/cascade.h"

#include "csv/csv.h"

#endif


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


#include "dsp/cascade.h"

#include "signals/signals.h"
#include "helper/helper.h"


int dsptools::cascade( std::vector<data_point_t> * d , uint64_t prev_max , const signal_def_t & def )
{

  const int n = d->size();

  // rightmost modified sample in the old span
  int last = -1;
  for (int i=0; i<n; i++)
    {
      if ( (*d)[i].msec > prev_max ) break;
      if ( (*d)[i].modified ) last = i;
    }

  if ( last == -1 ) return 0;

  // the last edit must still be in effect, i.e. nothing modified after it
  for (int i=last+1; i<n; i++)
    if ( (*d)[i].modified ) return 0;

  const double delta = (*d)[last].value - def.dflt;

  const double v = def.clamp( def.dflt + delta );

  int changed = 0;

  for (int i=last+1; i<n; i++)
    {
      data_point_t & p = (*d)[i];
      if ( p.msec <= prev_max || p.modified ) continue;
      p.value = v;
      ++changed;
    }

  Helper::debug( "cascaded " + def.label + " by " + Helper::dbl2str( delta )
		 + " into " + Helper::int2str( changed ) + " samples" );

  return changed;
}

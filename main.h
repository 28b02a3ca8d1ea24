
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


#ifndef __VITALINE_MAIN_H__
#define __VITALINE_MAIN_H__

#include <string>

struct param_t;

// misc helper: build global params from cmdline
void build_param( param_t * , int argc , char** argv , int );

// misc helper: read and parse an @include file
void include_param_file( const std::string & paramfile , param_t * );

// misc helper: apply global params to the defaults
void apply_param( const param_t & );

// misc helper: manage memory resource issues
void NoMem();

// misc helper: return version
std::string vitaline_version();

#endif

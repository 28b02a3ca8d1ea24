
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


#ifndef __VITALINE_EVAL_H__
#define __VITALINE_EVAL_H__

#include <string>
#include <vector>

#include "param.h"

struct store_t;


//
// A script of commands: read from stdin (or a string), then
// evaluated in order against a single store
//

class cmd_t
{

 public:

  // read from std::cin
  cmd_t();

  // read from a string; commands separated by '&' or newlines
  cmd_t( const std::string & str );

  bool read( const std::string * str = NULL , bool silent = false );

  void reset();

  bool eval( store_t & );

  bool empty() const ;

  bool valid() const ;

  bool badline() const ;

  std::string offending() const ;

  int num_cmds() const ;

  std::string cmd( const int i ) ;

  param_t & param( const int i ) ;

  bool is( const int n , const std::string & s ) const;

  bool quit() const ;

  void quit( bool b ) ;

 private:

  std::vector<std::string> cmds;

  std::vector<param_t> params;

  std::string line;

  bool error;

  bool will_quit;

};


//
// command handlers
//

void proc_select( store_t & , param_t & );
void proc_init( store_t & , param_t & );
void proc_duration( store_t & , param_t & );
void proc_sample_rate( store_t & , param_t & );
void proc_add( store_t & , param_t & );
void proc_move( store_t & , param_t & );
void proc_delete( store_t & , param_t & );
void proc_set( store_t & , param_t & );
void proc_reset( store_t & , param_t & );
void proc_toggle( store_t & , param_t & );
void proc_zoom( store_t & , param_t & );
void proc_cascade( store_t & , param_t & );
void proc_sync( store_t & , param_t & );
void proc_undo( store_t & , param_t & );
void proc_redo( store_t & , param_t & );
void proc_import( store_t & , param_t & );
void proc_export( store_t & , param_t & );
void proc_desc( store_t & , param_t & );
void proc_dump( store_t & , param_t & );

#endif


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


#include "main.h"

#include "vitaline.h"

#include <cstring>
#include <new>
#include <unistd.h>

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //

  if ( argc >= 2 && ( strcmp( argv[1] ,"-v" ) == 0 || strcmp( argv[1] ,"--version" ) == 0 ) )
    {
      global.api();
      std::cerr << vitaline_version();
      std::cerr << "zlib v" << zlibVersion() << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = vitaline_version() +
    "primary usage: vitaline [dur=SEC] [sr=MS] [start=H:MM] [history=N]\n"
    "                        [cascade=T|F] [sync=T|F] [snap=T|F] [tab=T|F]\n"
    "                        [silent=T] [log=FILE] [@param-file] < command-file\n"
    "\n"
    "commands: SELECT INIT DURATION SR ADD MOVE DEL SET RESET TOGGLE ZOOM\n"
    "          CASCADE SYNC UNDO REDO IMPORT EXPORT DESC DUMP\n";

  if ( argc >= 2 && ( strcmp( argv[1] , "-h" ) == 0 || strcmp( argv[1] , "--help" ) == 0 ) )
    {
      global.api();
      std::cerr << usage_msg;
      std::exit( globals::retcode );
    }

  if ( argc == 1 && isatty(STDIN_FILENO) )
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }


  //
  // global parameters
  //

  build_param( &globals::param , argc , argv , 1 );

  apply_param( globals::param );

  if ( globals::write_log )
    logger.write_log( globals::log_file );

  logger.banner( globals::version , globals::date );

  if ( std::cin.eof() || ! std::cin.good() )
    Helper::halt( "no input, quitting" );


  //
  // read and run the script against a single store
  //

  cmd_t cmd;

  if ( cmd.badline() )
    Helper::halt( "problem reading commands" );

  if ( cmd.empty() )
    {
      logger << "  no commands given\n";
      std::exit( globals::retcode );
    }

  store_t store;

  logger << "  timeline: " << store.timeline().duration << "s at "
	 << store.timeline().sr << "ms, clock start " << globals::clock_start << "\n";

  cmd.eval( store );

  std::exit( globals::retcode );

}


void build_param( param_t * param , int argc , char** argv , int start )
{

  for (int i=start;i<argc;i++)
    {

      const std::string a = argv[i];

      // @includes
      if ( a[0] == '@' )
	{
	  include_param_file( a , param );
	  continue;
	}

      // key=value, or a bare key as a flag
      param->parse( a );
    }

}


void include_param_file( const std::string & paramfile , param_t * param )
{

  // '@.' is an explicit no-op
  if ( paramfile.size() <= 1 || paramfile == "@." ) return;

  const std::string filename = Helper::expand( paramfile.substr(1) );

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not open " + filename );

  std::ifstream INC( filename.c_str() , std::ios::in );
  if ( INC.bad() ) Helper::halt("could not open file: " + filename );

  while ( ! INC.eof() )
    {
      std::string line;
      Helper::safe_getline( INC , line );
      line = Helper::lrtrim( line );
      if ( line == "" ) continue;

      // skip % comments
      if ( line[0] == '%' ) continue;

      // key=value, or tab-delimited key value
      std::vector<std::string> tok = Helper::quoted_parse( line , "\t=" );
      if ( tok.size() != 2 )
	Helper::halt( "bad line in " + filename + " (expecting key=value): " + line );

      param->add( Helper::lrtrim( tok[0] ) , Helper::lrtrim( tok[1] ) );
    }

  INC.close();
}


void apply_param( const param_t & param )
{
  std::set<std::string> keys = param.keys();
  std::set<std::string>::const_iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      // a bare flag means T
      const std::string v = param.empty( *kk ) ? "T" : param.value( *kk );
      if ( ! globals::set( *kk , v ) )
	Helper::halt( "unrecognized option: " + *kk );
      ++kk;
    }
}


std::string vitaline_version()
{
  std::stringstream ss;
  ss << "vitaline version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "vitaline build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Try a shorter duration or a coarser sample rate...*\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}


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

// log utility initially based on: https://github.com/Manu343726/Cpp11CustomLogClass

#ifndef __LOGGER_H__
#define	__LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;

  std::ofstream  _log_file;

  std::stringstream ss;

  bool         is_off;

  static std::string now()
  {
    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);
    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);
    return BUFFER;
  }

 public:

 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream )
  {
    is_off = false;
    save_log = false;
  }

  void write_log( const std::string & log_file )
  {
    if ( is_off || globals::silent || globals::api_mode ) return;

    if ( save_log )
      stop_writing_log();

    _log_file.open( log_file.c_str() );
    save_log = true;
  }

  void stop_writing_log()
  {
    if ( save_log )
      {
	_log_file.close();
	save_log = false;
      }
  }

  void flush() { _out_stream.flush(); }

  void flush_cache() { ss.str(std::string()); }

  void off() { flush(); flush_cache(); stop_writing_log(); is_off = true; }

  void on() { is_off = false; }

  void banner( const std::string & v , const std::string & bd )
  {

    if ( is_off || globals::silent ) return;

    std::stringstream b;
    b << "===================================================================" << "\n"
      << _log_header
      << " | " << v << ", " << bd << " | starting " << now()  << " +++\n"
      << "===================================================================" << "\n";

    _out_stream << b.str();
    if ( save_log ) _log_file << b.str();
  }


  ~logger_t()
    {

      if ( is_off || globals::silent || globals::api_mode ) return;

      std::stringstream b;
      b << "-------------------------------------------------------------------"
	<< "\n"
	<< "+++ vitaline | finishing "
	<< now()
	<< "                   +++\n"
	<< "==================================================================="
	<< "\n";

      _out_stream << b.str();

      if ( save_log )
	{
	  _log_file << b.str();
	  stop_writing_log();
	}

    }


  void warning( const std::string & msg )
  {
    if ( is_off ) return ;

    if ( globals::cache_log )
      ss << " ** warning: " << msg << " ** " << std::endl;
    else if ( ! globals::silent )
      {
	_out_stream << " ** warning: " << msg << " ** " << std::endl;
	if ( save_log )
	  _log_file << " ** warning: " << msg << " ** " << std::endl;
      }
  }


  template<typename T>
    logger_t& operator<< (const T& data)
    {
      if ( is_off ) return *this;

      if ( ! globals::silent )
	{
	  _out_stream << data;
	  if ( save_log )
	    _log_file << data;
	}

      if ( globals::cache_log )
	ss << data;

      return *this;

    }


  // drain anything cached in API mode
  std::string print_buffer()
    {
      std::string retval = ss.str();
      ss.str(std::string());
      return retval;
    }


};


#endif

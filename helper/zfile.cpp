
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

#include "helper/zfile.h"
#include "helper/helper.h"


bool zfile_t::is_gz( const std::string & filename )
{
  return Helper::file_extension( filename , "gz" );
}


bool zfile_t::open( const std::string & filename , zmode_t m )
{

  close();

  mode = m;

  compressed = is_gz( filename );

  at_eof = false;

  pending.clear();

  if ( compressed )
    {
      gz = gzopen( filename.c_str() , mode == READ ? "rb" : "wb" );
      is_open = gz != NULL;
    }
  else if ( mode == READ )
    {
      in.open( filename.c_str() , std::ios::in | std::ios::binary );
      is_open = in.good();
    }
  else
    {
      out.open( filename.c_str() , std::ios::out | std::ios::binary );
      is_open = out.good();
    }

  return is_open;
}


void zfile_t::close()
{
  if ( gz != NULL )
    {
      gzclose( gz );
      gz = NULL;
    }

  if ( in.is_open() ) in.close();

  if ( out.is_open() ) out.close();

  is_open = false;
}


bool zfile_t::fill()
{
  // pull the next block of decompressed bytes onto 'pending'
  char buf[ 16384 ];
  int n = gzread( gz , buf , sizeof( buf ) );
  if ( n <= 0 ) return false;
  pending.append( buf , n );
  return true;
}


bool zfile_t::getline( std::string * line )
{

  line->clear();

  if ( ! is_open || mode != READ || at_eof ) return false;

  if ( ! compressed )
    {
      Helper::safe_getline( in , *line );
      if ( in.eof() && line->empty() )
	{
	  at_eof = true;
	  return false;
	}
      return true;
    }

  //
  // compressed: scan the read-ahead buffer for a line ending
  //

  size_t p = 0;

  while ( 1 )
    {

      size_t e = pending.find_first_of( "\r\n" , p );

      if ( e != std::string::npos )
	{
	  // a trailing '\r' may be the first half of "\r\n"
	  if ( pending[e] == '\r' && e + 1 == pending.size() )
	    {
	      if ( fill() ) { p = e; continue; }
	    }

	  *line = pending.substr( 0 , e );

	  size_t skip = 1;
	  if ( pending[e] == '\r' && e + 1 < pending.size() && pending[e+1] == '\n' ) skip = 2;

	  pending.erase( 0 , e + skip );
	  return true;
	}

      p = pending.size();

      if ( ! fill() )
	{
	  // last line without an ending
	  if ( pending.empty() )
	    {
	      at_eof = true;
	      return false;
	    }
	  *line = pending;
	  pending.clear();
	  return true;
	}
    }

  return false;
}


bool zfile_t::write( const std::string & s )
{
  if ( ! is_open || mode != WRITE ) return false;

  if ( compressed )
    {
      if ( s.empty() ) return true;
      return gzwrite( gz , s.data() , s.size() ) == (int)s.size();
    }

  out << s;
  return out.good();
}

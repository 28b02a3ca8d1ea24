
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cstdio>
#include <cstdlib>
#include <iomanip>

extern logger_t logger;


std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( (unsigned char)s[i] );
  return j;
}


std::string Helper::remove_all_quotes( const std::string & s , const char q2 )
{
  std::string r;
  r.reserve( s.size() );
  for (int i=0; i<s.size(); i++)
    if ( ! ( s[i] == '"' || s[i] == q2 ) ) r += s[i];
  return r;
}


bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else  (including empty, i.e. 'var'  --> 'var=T'
  if ( s.size() == 0 ) return false;
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}


bool Helper::file_extension( const std::string & f, const std::string & ext , bool with_period )
{
  const std::string e = with_period ? "." + ext : ext ;
  if ( f.size() < e.size() ) return false;
  return Helper::iequals( f.substr( f.size() - e.size() ) , e );
}


bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i]))
      return false;
  return true;
}


bool Helper::contains( const std::string & a , const std::string & b )
{
  return Helper::toupper( a ).find( Helper::toupper( b ) ) != std::string::npos;
}


bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }
  return false;
}


std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv( "HOME" );
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}


void Helper::halt( const std::string & msg )
{

  // some other code handles the exit, e.g. throws back to an API caller
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  // do not kill the process?
  if ( ! globals::bail_on_fail ) return;

  // switch logger off , i.e. as we don't want close-out msg
  logger.off();

  // generic bail function (not using logger)
  std::cerr << "error : " << msg << "\n";

  std::exit(1);
}


void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}


void Helper::debug( const std::string & msg )
{
  if ( globals::verbose )
    std::cerr << "debug : " << msg << "\n";
}


std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(uint64_t n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}


bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::str2int64(const std::string & s , uint64_t * i)
{
  // istream will happily wrap a negative into an unsigned
  if ( s.find( '-' ) != std::string::npos ) return false;
  return from_string<uint64_t>(*i,s,std::dec);
}


std::vector<std::string> Helper::parse( const std::string & item , const std::string & s , bool empty )
{
  // no quote character can match a real delimiter here
  return Helper::quoted_parse( item , s , '\0' , '\0' , empty );
}


std::vector<std::string> Helper::quoted_parse( const std::string & item , const std::string & s , const char q , const char q2 , bool empty )
{

  std::vector<std::string> strs;
  if ( item.size() == 0 ) return strs;

  const bool quoting = q != '\0' || q2 != '\0';

  int p=0;

  bool in_quote = false;

  for (int j=0; j<item.size(); j++)
    {

      if ( quoting && ( item[j] == q || item[j] == q2 ) ) in_quote = ! in_quote;

      if ( (!in_quote) && s.find( item[j] ) != std::string::npos )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "" );
	      ++p;
	    }
	  else
	    {
	      strs.push_back( item.substr(p,j-p) );
	      p=j+1;
	    }
	}
    }

  if ( empty && p == item.size() )
    strs.push_back( "" );
  else if ( p < item.size() )
    strs.push_back( item.substr(p) );

  return strs;
}


std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  // handles \n, \r\n and \r line endings; the sentry guards direct
  // use of the streambuf

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {
      int c = sb->sbumpc();
      switch (c)
	{
	case '\n':
	  return is;
	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;
	case EOF:
	  // also handle the case when the last line has no line ending
	  if (t.empty())
	    is.setstate(std::ios::eofbit);
	  return is;
	default:
	  t += (char)c;
	}
    }
}


std::string Helper::timestring( uint64_t msec )
{

  const uint64_t total_sec = msec / 1000;
  const uint64_t h = total_sec / 3600;
  const uint64_t m = ( total_sec % 3600 ) / 60;
  const uint64_t s = total_sec % 60;
  const uint64_t ms = msec % 1000;

  // return 00:00:00_000 format
  std::stringstream ss;
  ss << std::setfill( '0' )
     << std::setw(2) << h << ":"
     << std::setw(2) << m << ":"
     << std::setw(2) << s << "_"
     << std::setw(3) << ms;
  return ss.str();
}


bool Helper::timestring( const std::string & t0 , uint64_t * msec )
{

  // valid formats:   HH:MM:SS_mmm
  //                  HH:MM:SS
  //                  MM:SS        (legacy)
  //                  nnnnn        (plain msec)

  const std::string t = Helper::lrtrim( t0 );

  if ( t.size() == 0 ) return false;

  if ( t.find( ':' ) == std::string::npos )
    {
      if ( t.find( '_' ) != std::string::npos ) return false;
      return Helper::str2int64( t , msec );
    }

  std::vector<std::string> tok = Helper::parse( t , ":" , true );

  uint64_t ms = 0;

  // split off any _mmm from the final field
  std::string last = tok[ tok.size() - 1 ];
  std::vector<std::string> tok2 = Helper::parse( last , "_" , true );
  if ( tok2.size() == 2 )
    {
      // only valid with all three clock fields
      if ( tok.size() != 3 ) return false;
      if ( ! Helper::str2int64( tok2[1] , &ms ) ) return false;
      if ( ms > 999 ) return false;
      tok[ tok.size() - 1 ] = tok2[0];
    }
  else if ( tok2.size() != 1 ) return false;

  uint64_t h = 0 , m = 0 , s = 0;

  if ( tok.size() == 3 )
    {
      if ( ! Helper::str2int64( tok[0] , &h ) ) return false;
      if ( ! Helper::str2int64( tok[1] , &m ) ) return false;
      if ( ! Helper::str2int64( tok[2] , &s ) ) return false;
    }
  else if ( tok.size() == 2 )
    {
      if ( ! Helper::str2int64( tok[0] , &m ) ) return false;
      if ( ! Helper::str2int64( tok[1] , &s ) ) return false;
    }
  else
    return false;

  if ( s > 59 ) return false;
  // minutes may run on past 59 only in the legacy MM:SS form
  if ( tok.size() == 3 && m > 59 ) return false;

  *msec = ( ( h * 60 + m ) * 60 + s ) * 1000 + ms;
  return true;
}


bool Helper::hhmm( const std::string & t , int * h , int * m )
{
  std::vector<std::string> tok = Helper::parse( Helper::lrtrim( t ) , ":" , true );
  if ( tok.size() != 2 ) return false;
  if ( ! Helper::str2int( tok[0] , h ) ) return false;
  if ( ! Helper::str2int( tok[1] , m ) ) return false;
  if ( *h < 0 || *h > 23 || *m < 0 || *m > 59 ) return false;
  return true;
}


std::string Helper::clockstring( int h , int m , uint64_t msec )
{
  // whole minutes elapsed; seconds do not carry into the display
  const uint64_t elapsed = msec / 60000;

  const uint64_t total = (uint64_t)m + elapsed;

  const int mm = total % 60;
  const int hh = ( h + total / 60 ) % 24;

  std::stringstream ss;
  ss << hh << ":" << std::setfill( '0' ) << std::setw(2) << mm;
  return ss.str();
}

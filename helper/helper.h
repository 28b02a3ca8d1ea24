
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

#ifndef __HELPER_H__
#define __HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <cctype>
#include <stdint.h>
#include <map>
#include <cmath>

namespace Helper
{

  std::string toupper( const std::string & );

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](int c) {return !std::isspace(c);} ));
    return s;
  }

  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](int c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }

  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s.size() > 1 && ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );

  bool yesno( const std::string & );

  bool file_extension( const std::string & , const std::string & , bool with_period = true );

  // case insenstive string comparison
  bool iequals(const std::string& a, const std::string& b);

  // case-insensitive any match
  bool contains( const std::string& a, const std::string& b );

  bool fileExists(const std::string &);
  std::string expand( const std::string & f );

  std::istream& safe_getline(std::istream& is, std::string& t);

  void halt( const std::string & msg );
  void warn( const std::string & msg );
  void debug( const std::string & msg );

  std::string int2str(int n);
  std::string int2str(long n);
  std::string int2str(uint64_t n);
  std::string dbl2str(double n);
  std::string dbl2str(double n, int dp);

  template<typename T>
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;

      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }

  bool str2dbl(const std::string & , double * );
  bool str2int(const std::string & , int * );
  bool str2int64(const std::string & , uint64_t * );

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      if ( (iss >> f >> t).fail() ) return false;
      // require the whole token to be consumed
      iss >> std::ws;
      return iss.eof();
    }

  // split on any of the characters in 's'
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );

  // as above, but delimiters inside quotes are ignored
  std::vector<std::string> quoted_parse(const std::string & item , const std::string & s , const char q = '"' , const char q2 = '\'' , bool empty = false );


  //
  // time-strings
  //

  // msec --> HH:MM:SS_mmm
  std::string timestring( uint64_t msec );

  // HH:MM:SS_mmm, HH:MM:SS, MM:SS or plain msec --> msec
  bool timestring( const std::string & , uint64_t * msec );

  // H:MM (or HH:MM) --> hour, minute
  bool hhmm( const std::string & , int * h , int * m );

  // wall-clock H:MM for 'msec' past a start time, wrapping at 24 hours
  std::string clockstring( int h , int m , uint64_t msec );

}

#endif

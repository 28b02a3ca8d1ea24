
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


#ifndef __VITALINE_ZFILE_H__
#define __VITALINE_ZFILE_H__

#include <zlib.h>

#include <fstream>
#include <sstream>
#include <string>


//
// Line-oriented text file, read or written either plain or
// gzip-compressed (any name ending .gz)
//

struct zfile_t {

 public:

  enum zmode_t { READ , WRITE };

  zfile_t() : gz(NULL) , compressed(false) , is_open(false) , at_eof(false) , mode(READ) { }

  ~zfile_t() { close(); }

  bool open( const std::string & filename , zmode_t mode );

  void close();

  bool good() const { return is_open && ! at_eof; }

  // false at end of file; handles \n, \r\n and \r endings
  bool getline( std::string * line );

  // write a string verbatim
  bool write( const std::string & s );

  static bool is_gz( const std::string & filename );

 private:

  zfile_t( const zfile_t & );
  zfile_t & operator=( const zfile_t & );

  gzFile gz;

  std::ifstream in;

  std::ofstream out;

  bool compressed;

  bool is_open;

  bool at_eof;

  zmode_t mode;

  // read-ahead buffer for the compressed stream
  std::string pending;

  bool fill();

};

#endif

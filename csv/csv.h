
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


#ifndef __CSV_H__
#define __CSV_H__

#include <string>
#include <vector>
#include <optional>

#include "defs/defs.h"

struct timeline_t;


// an export cell: empty where there is no value
typedef std::optional<std::string> cell_t;

typedef std::vector<cell_t> row_t;


//
// A delimited text table, as read from disk
//

struct csv_table_t
{

  csv_table_t() : delim( ',' ) { }

  char delim;

  std::vector<std::string> header;

  std::vector<std::vector<std::string> > rows;

};


namespace csv
{

  //
  // reading
  //

  // RFC4180 field split of one line; quoted fields may hold the
  // delimiter, and "" inside quotes is a literal quote
  std::vector<std::string> split( const std::string & line , char delim = ',' );

  // header + rows from a (possibly .gz) file; ',' or tab delimited
  bool read( const std::string & filename , csv_table_t * table , std::string * errmsg );

  // as above, from in-memory lines
  bool read( const std::vector<std::string> & lines , csv_table_t * table , std::string * errmsg );

  // index of the time column, or -1
  int time_column( const std::vector<std::string> & header );

  // stage a new timeline from 'table', carrying over everything in
  // 'current' not in the table; false (and 'current' semantics
  // untouched) if the table cannot be imported
  bool import( const csv_table_t & table ,
	       const timeline_t & current ,
	       timeline_t * staged ,
	       std::string * errmsg );


  //
  // writing
  //

  // integer / 2dp / 1dp depending on the column label
  std::string format_value( double v , const std::string & label );

  // one row per grid timestamp, one cell per requested column
  std::vector<row_t> export_rows( const timeline_t & timeline ,
				  const std::vector<std::string> & columns );

  // quote (and double quotes) if the field holds delim, quote, CR or LF
  std::string escape( const std::string & field , char delim = ',' );

  // header + rows, each line ending '\n'
  std::string to_csv( const std::vector<std::string> & columns ,
		      const std::vector<row_t> & rows ,
		      char delim = ',' );

  bool write( const std::string & filename , const std::string & text , std::string * errmsg );

}

#endif

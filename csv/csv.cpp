
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


#include "csv/csv.h"

#include "timeline/timeline.h"
#include "timeline/grid.h"
#include "signals/signals.h"
#include "dsp/resample.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/zfile.h"

#include <algorithm>
#include <cmath>
#include <set>

extern logger_t logger;


std::vector<std::string> csv::split( const std::string & line , char delim )
{

  std::vector<std::string> r;

  std::string f;

  bool in_quote = false;

  for (int i=0; i<line.size(); i++)
    {
      const char c = line[i];

      if ( in_quote )
	{
	  if ( c == '"' )
	    {
	      if ( i + 1 < line.size() && line[i+1] == '"' )
		{
		  f += '"';
		  ++i;
		}
	      else
		in_quote = false;
	    }
	  else
	    f += c;
	}
      else if ( c == '"' )
	in_quote = true;
      else if ( c == delim )
	{
	  r.push_back( f );
	  f.clear();
	}
      else
	f += c;
    }

  r.push_back( f );

  return r;
}


bool csv::read( const std::vector<std::string> & lines , csv_table_t * table , std::string * errmsg )
{

  table->header.clear();
  table->rows.clear();

  bool has_header = false;

  for (int l=0; l<lines.size(); l++)
    {

      std::string line = lines[l];

      if ( Helper::lrtrim( line ) == "" ) continue;

      if ( ! has_header )
	{
	  // UTF-8 byte-order mark
	  if ( line.size() >= 3 && line.compare( 0 , 3 , "\xEF\xBB\xBF" ) == 0 )
	    line = line.substr( 3 );

	  // tab-delimited if there are tabs but no commas
	  table->delim = line.find( '\t' ) != std::string::npos && line.find( ',' ) == std::string::npos ? '\t' : ',' ;

	  table->header = csv::split( line , table->delim );
	  for (int j=0; j<table->header.size(); j++)
	    table->header[j] = Helper::lrtrim( table->header[j] );

	  has_header = true;
	  continue;
	}

      std::vector<std::string> row = csv::split( line , table->delim );

      // ragged rows are padded / cut to the header
      row.resize( table->header.size() );

      table->rows.push_back( row );
    }

  if ( ! has_header )
    {
      *errmsg = "file is empty";
      return false;
    }

  return true;
}


bool csv::read( const std::string & filename , csv_table_t * table , std::string * errmsg )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) )
    {
      *errmsg = "could not open " + f;
      return false;
    }

  zfile_t zf;

  if ( ! zf.open( f , zfile_t::READ ) )
    {
      *errmsg = "could not open " + f;
      return false;
    }

  std::vector<std::string> lines;
  std::string line;
  while ( zf.getline( &line ) )
    lines.push_back( line );

  zf.close();

  return read( lines , table , errmsg );
}


int csv::time_column( const std::vector<std::string> & header )
{

  // 1) 'time'
  for (int j=0; j<header.size(); j++)
    if ( Helper::iequals( header[j] , "time" ) ) return j;

  // 2) 'relativetimemilliseconds' or 'milliseconds'
  for (int j=0; j<header.size(); j++)
    if ( Helper::iequals( header[j] , "relativetimemilliseconds" )
	 || Helper::iequals( header[j] , "milliseconds" ) ) return j;

  // 3) anything holding 'milliseconds'
  for (int j=0; j<header.size(); j++)
    if ( Helper::contains( header[j] , "milliseconds" ) ) return j;

  // 4) anything holding 'time', other than a known monitor column
  //    (e.g. 'NBP (Time Remaining)')
  for (int j=0; j<header.size(); j++)
    if ( Helper::contains( header[j] , "time" ) && ! signal_registry_t::is_header( header[j] ) ) return j;

  return -1;
}


bool csv::import( const csv_table_t & table ,
		  const timeline_t & current ,
		  timeline_t * staged ,
		  std::string * errmsg )
{

  //
  // time column
  //

  const int tc = time_column( table.header );

  if ( tc == -1 )
    {
      *errmsg = "no time column (expecting a header such as Time or RelativeTimeMilliseconds)";
      return false;
    }

  if ( table.rows.size() == 0 )
    {
      *errmsg = "no data rows";
      return false;
    }


  //
  // signal columns (first of any repeats wins)
  //

  std::vector<int> cols;
  std::vector<signal_key_t> keys;

  for (int j=0; j<table.header.size(); j++)
    {
      if ( j == tc ) continue;
      signal_key_t k;
      if ( ! signal_registry_t::lookup( table.header[j] , &k ) ) continue;
      if ( std::find( keys.begin() , keys.end() , k ) != keys.end() )
	{
	  Helper::warn( "ignoring repeated column " + table.header[j] );
	  continue;
	}
      cols.push_back( j );
      keys.push_back( k );
    }

  if ( keys.size() == 0 )
    {
      *errmsg = "no column matches a known signal (header: "
	+ Helper::stringize( table.header , "," ) + ")";
      return false;
    }


  //
  // timestamps: drop any row whose time does not parse
  //

  std::vector<std::pair<uint64_t,int> > times;

  for (int r=0; r<table.rows.size(); r++)
    {
      uint64_t t = 0;
      if ( tc < table.rows[r].size() && Helper::timestring( table.rows[r][tc] , &t ) )
	times.push_back( std::make_pair( t , r ) );
    }

  if ( times.size() == 0 )
    {
      *errmsg = "no rows with a valid time value";
      return false;
    }

  const int dropped = table.rows.size() - times.size();
  if ( dropped )
    Helper::warn( "dropped " + Helper::int2str( dropped ) + " rows without a valid time value" );

  std::stable_sort( times.begin() , times.end() ,
		    []( const std::pair<uint64_t,int> & a , const std::pair<uint64_t,int> & b )
		    { return a.first < b.first; } );

  const uint64_t tmin = times[0].first;
  const uint64_t tmax = times[ times.size() - 1 ].first;

  int distinct = 1;
  for (int i=1; i<times.size(); i++)
    if ( times[i].first != times[i-1].first ) ++distinct;


  //
  // grid: whole seconds, rate from mean spacing
  //

  double dur = std::ceil( ( tmax - tmin ) / 1000.0 );
  if ( dur < 1 ) dur = 1;

  int sr = globals::min_import_sample_rate;
  if ( distinct >= 2 )
    {
      const double mean = ( tmax - tmin ) / (double)( distinct - 1 );
      const int64_t r = std::llround( mean );
      sr = r < globals::min_import_sample_rate ? globals::min_import_sample_rate : r;
    }

  if ( ! grid::valid( dur , sr , errmsg ) ) return false;

  timeline_t t( dur , sr );

  t.selected = keys;


  //
  // carry over any signal not in the file, hidden
  //

  const uint64_t tmax_new = grid::duration_msec( dur );

  std::map<signal_key_t,signal_state_t>::const_iterator ss = current.signals.begin();
  while ( ss != current.signals.end() )
    {
      if ( std::find( keys.begin() , keys.end() , ss->first ) == keys.end() )
	{
	  const signal_def_t & def = signal_registry_t::def( ss->first );

	  signal_state_t s = ss->second;

	  s.data = dsptools::resample_rate( dsptools::resample_duration( s.data , dur , current.sr , def , false ) ,
					    dur , sr , def );
	  s.cps.clear();
	  for (int j=0; j<ss->second.cps.size(); j++)
	    if ( ss->second.cps[j].msec <= tmax_new ) s.cps.push_back( ss->second.cps[j] );

	  s.visible = false;
	  s.zoom = zoom_t( ZOOM_FULL , 0 , dur );

	  t.signals[ ss->first ] = s;
	}
      ++ss;
    }


  //
  // imported signals
  //

  int order = current.next_order();

  int bad_cells = 0;

  for (int c=0; c<cols.size(); c++)
    {

      const signal_def_t & def = signal_registry_t::def( keys[c] );

      std::vector<data_point_t> pts;

      for (int i=0; i<times.size(); i++)
	{
	  const std::vector<std::string> & row = table.rows[ times[i].second ];
	  if ( cols[c] >= row.size() ) continue;

	  const std::string cell = Helper::lrtrim( row[ cols[c] ] );
	  if ( cell == "" ) continue;

	  double v = 0;
	  if ( ! Helper::str2dbl( cell , &v ) )
	    {
	      ++bad_cells;
	      continue;
	    }

	  const data_point_t p( times[i].first - tmin , def.clamp( v ) , false );

	  // a repeated time keeps the later row
	  if ( pts.size() != 0 && pts[ pts.size() - 1 ].msec == p.msec )
	    pts[ pts.size() - 1 ] = p;
	  else
	    pts.push_back( p );
	}

      signal_state_t s;

      s.data = dsptools::resample_rate( pts , dur , sr , def );
      s.visible = true;
      s.order = current.has( keys[c] ) ? current.signal( keys[c] ).order : order++ ;
      s.zoom = zoom_t( ZOOM_FULL , 0 , dur );

      t.signals[ keys[c] ] = s;
    }

  if ( bad_cells )
    Helper::warn( "skipped " + Helper::int2str( bad_cells ) + " non-numeric values" );

  *staged = t;

  return true;
}


std::string csv::format_value( double v , const std::string & label )
{

  if ( label.find( "HR" ) != std::string::npos
       || label.find( "RR" ) != std::string::npos
       || label.find( "Pulse" ) != std::string::npos
       || label.find( "SpO2" ) != std::string::npos
       || label.find( "BIS" ) != std::string::npos
       || label.find( "SQI" ) != std::string::npos
       || label.find( "EMG" ) != std::string::npos )
    {
      // round half up
      const double r = std::floor( v + 0.5 );
      return Helper::int2str( (long)r );
    }

  if ( label.find( "MAC" ) != std::string::npos )
    return Helper::dbl2str( v , 2 );

  return Helper::dbl2str( v , 1 );
}


std::vector<row_t> csv::export_rows( const timeline_t & timeline ,
				     const std::vector<std::string> & columns )
{

  enum col_t { COL_TIME , COL_MSEC , COL_CLOCK , COL_SIGNAL , COL_NONE };

  int h = 0 , m = 0;
  if ( ! Helper::hhmm( globals::clock_start , &h , &m ) )
    {
      Helper::warn( "bad clock start " + globals::clock_start + ", using 00:00" );
      h = m = 0;
    }

  const int nc = columns.size();

  std::vector<col_t> type( nc , COL_NONE );
  std::vector<const signal_state_t *> state( nc , (const signal_state_t *)NULL );
  std::vector<const signal_def_t *> def( nc , (const signal_def_t *)NULL );

  for (int c=0; c<nc; c++)
    {
      if ( Helper::iequals( columns[c] , "Time" ) ) type[c] = COL_TIME;
      else if ( Helper::iequals( columns[c] , "RelativeTimeMilliseconds" ) ) type[c] = COL_MSEC;
      else if ( Helper::iequals( columns[c] , "Clock" ) ) type[c] = COL_CLOCK;
      else
	{
	  signal_key_t k;
	  if ( signal_registry_t::lookup( columns[c] , &k ) && timeline.has( k ) && timeline.signal( k ).visible )
	    {
	      type[c] = COL_SIGNAL;
	      state[c] = &timeline.signal( k );
	      def[c] = &signal_registry_t::def( k );
	    }
	}
    }

  const uint64_t n = timeline.size();

  std::vector<row_t> rows( n , row_t( nc ) );

  for (uint64_t i=0; i<n; i++)
    {

      const uint64_t t = grid::msec( i , timeline.sr );

      row_t & row = rows[i];

      for (int c=0; c<nc; c++)
	{
	  switch ( type[c] )
	    {
	    case COL_TIME :
	      row[c] = Helper::timestring( t );
	      break;
	    case COL_MSEC :
	      row[c] = Helper::int2str( t );
	      break;
	    case COL_CLOCK :
	      row[c] = Helper::clockstring( h , m , t );
	      break;
	    case COL_SIGNAL :
	      {
		const std::vector<data_point_t> & d = state[c]->data;
		if ( i < d.size() && d[i].msec == t )
		  row[c] = format_value( def[c]->clamp( d[i].value ) , def[c]->label );
	      }
	      break;
	    default :
	      break;
	    }
	}
    }

  return rows;
}


std::string csv::escape( const std::string & field , char delim )
{
  if ( field.find_first_of( std::string( "\"\r\n" ) + delim ) == std::string::npos )
    return field;

  std::string r = "\"";
  for (int i=0; i<field.size(); i++)
    {
      if ( field[i] == '"' ) r += "\"\"";
      else r += field[i];
    }
  r += "\"";
  return r;
}


std::string csv::to_csv( const std::vector<std::string> & columns ,
			 const std::vector<row_t> & rows ,
			 char delim )
{

  std::stringstream ss;

  for (int c=0; c<columns.size(); c++)
    ss << ( c ? std::string( 1 , delim ) : "" ) << escape( columns[c] , delim );
  ss << "\n";

  for (int r=0; r<rows.size(); r++)
    {
      for (int c=0; c<rows[r].size(); c++)
	{
	  if ( c ) ss << delim;
	  if ( rows[r][c] ) ss << escape( *rows[r][c] , delim );
	}
      ss << "\n";
    }

  return ss.str();
}


bool csv::write( const std::string & filename , const std::string & text , std::string * errmsg )
{

  const std::string f = Helper::expand( filename );

  zfile_t zf;

  if ( ! zf.open( f , zfile_t::WRITE ) )
    {
      *errmsg = "could not open " + f + " for writing";
      return false;
    }

  if ( ! zf.write( text ) )
    {
      *errmsg = "problem writing " + f;
      return false;
    }

  zf.close();

  return true;
}

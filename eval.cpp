
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


#include "eval.h"

#include "vitaline.h"

extern logger_t logger;


//
// cmd_t
//

cmd_t::cmd_t()
{
  reset();
  error = ! read();
}

cmd_t::cmd_t( const std::string & str )
{
  reset();
  error = ! read( &str , true );
}

void cmd_t::reset()
{
  cmds.clear();
  params.clear();
  line = "";
  error = false;
  will_quit = false;
}

bool cmd_t::empty() const
{
  return will_quit;
}

bool cmd_t::valid() const
{
  return ! error;
}

bool cmd_t::badline() const
{
  return error;
}

std::string cmd_t::offending() const
{
  return ( error ? line : "" );
}

int cmd_t::num_cmds() const
{
  return cmds.size();
}

std::string cmd_t::cmd( const int i )
{
  return cmds[i];
}

param_t & cmd_t::param( const int i )
{
  return params[i];
}

bool cmd_t::is( const int n , const std::string & s ) const
{
  if ( n < 0 || n >= cmds.size() ) Helper::halt( "bad command number" );
  return Helper::iequals( cmds[n] , s );
}

bool cmd_t::quit() const
{
  return will_quit;
}

void cmd_t::quit( bool b )
{
  will_quit = b;
}


// one command per line; indented lines continue the previous
// command; '%' starts a comment (unless quoted)

static std::string gather( std::istream & in )
{

  std::stringstream ss;

  bool first_cmd = true;

  while ( 1 )
    {
      std::string s;
      Helper::safe_getline( in , s );
      if ( in.eof() && s == "" ) break;
      if ( s == "" ) continue;

      bool continuation = s[0] == ' ' || s[0] == '\t';

      if ( s.find( "%" ) != std::string::npos )
	{
	  bool inquote = false;
	  int comment_start = -1;
	  for (int i=0;i<s.size();i++)
	    {
	      if ( s[i] == '"' ) inquote = ! inquote;
	      if ( s[i] == '%' && ! inquote ) { comment_start = i; break; }
	    }
	  if ( comment_start != -1 )
	    s = s.substr( 0 , comment_start );
	}

      s = Helper::lrtrim( s );

      if ( s.size() > 0 )
	{
	  if ( ! continuation )
	    {
	      if ( ! first_cmd ) ss << " & ";
	      first_cmd = false;
	    }
	  else
	    ss << " ";
	  ss << s ;
	}
    }

  return ss.str();
}


bool cmd_t::read( const std::string * str , bool silent )
{

  bool cmdline_mode = str == NULL;

  if ( cmdline_mode && std::cin.eof() ) return false;

  if ( (!cmdline_mode) && str->size() == 0 ) return false;

  reset();

  if ( cmdline_mode )
    line = gather( std::cin );
  else
    {
      std::istringstream in( *str );
      line = gather( in );
    }

  // change any unquoted '&' to '\n'
  bool inquote = false;
  for (int i=0;i<line.size();i++)
    {
      if ( line[i] == '"' ) inquote = ! inquote;
      else if ( line[i] == '&' && ! inquote ) line[i] = '\n';
    }

  std::vector<std::string> tok = Helper::quoted_parse( line , "\n" );

  if ( tok.size() == 0 )
    {
      quit( true );
      return false;
    }

  for (int c=0;c<tok.size();c++)
    {
      std::vector<std::string> ctok = Helper::quoted_parse( tok[c] , "\t " );
      if ( ctok.size() == 0 ) continue;
      cmds.push_back( ctok[0] );
      param_t param;
      for (int j=1;j<ctok.size();j++) param.parse( ctok[j] );
      params.push_back( param );
    }

  if ( ! silent )
    for (int i=0;i<cmds.size();i++)
      {
	logger << ( i == 0 ? "commands: " : "        : " )
	       << "c" << i+1 << "\t" << cmds[i] << "\t"
	       << params[i].dump( "" , " " ) << "\n";
      }

  return true;
}


bool cmd_t::eval( store_t & store )
{

  for ( int c = 0 ; c < num_cmds() ; c++ )
    {

      logger << " ..................................................................\n"
	     << " CMD #" << c+1 << ": " << cmd(c) << "\n";
      logger << "   options: " << param(c).dump( "" , " " ) << "\n";

      if      ( is( c, "SELECT" ) )    proc_select( store , param(c) );
      else if ( is( c, "INIT" ) )      proc_init( store , param(c) );
      else if ( is( c, "DURATION" ) )  proc_duration( store , param(c) );
      else if ( is( c, "SR" ) )        proc_sample_rate( store , param(c) );
      else if ( is( c, "ADD" ) )       proc_add( store , param(c) );
      else if ( is( c, "MOVE" ) )      proc_move( store , param(c) );
      else if ( is( c, "DEL" ) )       proc_delete( store , param(c) );
      else if ( is( c, "SET" ) )       proc_set( store , param(c) );
      else if ( is( c, "RESET" ) )     proc_reset( store , param(c) );
      else if ( is( c, "TOGGLE" ) )    proc_toggle( store , param(c) );
      else if ( is( c, "ZOOM" ) )      proc_zoom( store , param(c) );
      else if ( is( c, "CASCADE" ) )   proc_cascade( store , param(c) );
      else if ( is( c, "SYNC" ) )      proc_sync( store , param(c) );
      else if ( is( c, "UNDO" ) )      proc_undo( store , param(c) );
      else if ( is( c, "REDO" ) )      proc_redo( store , param(c) );
      else if ( is( c, "IMPORT" ) )    proc_import( store , param(c) );
      else if ( is( c, "EXPORT" ) )    proc_export( store , param(c) );
      else if ( is( c, "DESC" ) )      proc_desc( store , param(c) );
      else if ( is( c, "DUMP" ) )      proc_dump( store , param(c) );
      else
	{
	  Helper::halt( "did not recognize command: " + cmd(c) );
	  return false;
	}

    }

  return true;
}



//
// option helpers
//

static signal_key_t one_signal( param_t & param )
{
  return signal_registry_t::key( param.requires( "sig" ) );
}


static std::vector<signal_key_t> signal_list( param_t & param )
{
  std::vector<std::string> labels = param.strvector( "sig" );

  if ( labels.size() == 0 ) Helper::halt( "command requires parameter sig" );

  if ( labels.size() == 1 && Helper::iequals( labels[0] , "default" ) )
    return signal_registry_t::default_active();

  if ( labels.size() == 1 && Helper::iequals( labels[0] , "all" ) )
    return signal_registry_t::all();

  std::vector<signal_key_t> keys;
  for (int i=0; i<labels.size(); i++)
    keys.push_back( signal_registry_t::key( labels[i] ) );
  return keys;
}


// t=HH:MM:SS_mmm (or msec) or sec=seconds
static bool point_time( param_t & param , uint64_t * msec )
{
  if ( param.has( "t" ) )
    {
      if ( ! Helper::timestring( param.value( "t" ) , msec ) )
	Helper::halt( "could not parse time t=" + param.value( "t" ) );
      return true;
    }

  if ( param.has( "sec" ) )
    {
      const double s = param.requires_dbl( "sec" );
      if ( s < 0 ) Helper::halt( "sec must not be negative" );
      *msec = std::llround( s * 1000.0 );
      return true;
    }

  return false;
}


// interactive placement: snap time to the zoom level, and value to
// the signal's step if value snapping is on
static void snap_point( const store_t & store , signal_key_t key , uint64_t * msec , double * value )
{
  const zoom_scale_t scale = store.timeline().signal( key ).zoom.scale;
  const double s = zoom_t::snap_time( *msec / 1000.0 , scale );
  *msec = std::llround( s * 1000.0 );
  if ( globals::snap_values )
    *value = signal_registry_t::def( key ).snap( *value );
}



//
// commands
//

void proc_select( store_t & store , param_t & param )
{
  std::vector<signal_key_t> keys = signal_list( param );
  store.select_signals( keys );

  std::vector<std::string> labels;
  for (int i=0; i<keys.size(); i++) labels.push_back( signal_registry_t::label( keys[i] ) );
  logger << "  selected " << Helper::stringize( labels , "," ) << "\n";
}


void proc_init( store_t & store , param_t & param )
{
  std::vector<signal_key_t> keys = signal_list( param );
  for (int i=0; i<keys.size(); i++)
    store.initialize_signal( keys[i] );
}


void proc_duration( store_t & store , param_t & param )
{
  double sec = 0;
  if ( param.has( "sec" ) ) sec = param.requires_dbl( "sec" );
  else if ( param.has( "min" ) ) sec = param.requires_dbl( "min" ) * 60.0;
  else Helper::halt( "DURATION requires sec or min" );

  const double prior = store.timeline().duration;

  if ( store.set_duration( sec ) )
    logger << "  duration " << prior << "s -> " << sec << "s, "
	   << store.timeline().size() << " samples per signal\n";
}


void proc_sample_rate( store_t & store , param_t & param )
{
  const int ms = param.requires_int( "ms" );

  const int prior = store.timeline().sr;

  if ( store.set_sample_rate( ms ) )
    logger << "  sample rate " << prior << "ms -> " << ms << "ms, "
	   << store.timeline().size() << " samples per signal\n";
}


void proc_add( store_t & store , param_t & param )
{
  const signal_key_t key = one_signal( param );

  uint64_t msec = 0;
  if ( ! point_time( param , &msec ) ) Helper::halt( "ADD requires t or sec" );

  double v = param.requires_dbl( "v" );

  if ( param.has( "snap" ) && store.timeline().has( key ) )
    snap_point( store , key , &msec , &v );

  if ( store.add_control_point( key , msec , v ) )
    logger << "  added " << signal_registry_t::label( key ) << " point at "
	   << Helper::timestring( msec ) << " = " << v << "\n";
}


void proc_move( store_t & store , param_t & param )
{
  const signal_key_t key = one_signal( param );

  const int idx = param.requires_int( "idx" );

  if ( ! store.timeline().has( key ) || idx < 0 || idx >= store.timeline().signal( key ).cps.size() )
    {
      Helper::warn( "no control point " + Helper::int2str( idx ) + " for " + signal_registry_t::label( key ) );
      return;
    }

  // anything not given stays as it was
  const data_point_t & p = store.timeline().signal( key ).cps[ idx ];
  uint64_t msec = p.msec;
  double v = p.value;

  point_time( param , &msec );
  if ( param.has( "v" ) ) v = param.requires_dbl( "v" );

  if ( param.has( "snap" ) )
    snap_point( store , key , &msec , &v );

  if ( store.move_control_point( key , idx , msec , v ) )
    logger << "  moved " << signal_registry_t::label( key ) << " point " << idx
	   << " to " << Helper::timestring( msec ) << " = " << v << "\n";
}


void proc_delete( store_t & store , param_t & param )
{
  const signal_key_t key = one_signal( param );
  const int idx = param.requires_int( "idx" );
  if ( store.delete_control_point( key , idx ) )
    logger << "  deleted " << signal_registry_t::label( key ) << " point " << idx << "\n";
}


void proc_set( store_t & store , param_t & param )
{
  const signal_key_t key = one_signal( param );

  uint64_t msec = 0;
  if ( ! point_time( param , &msec ) ) Helper::halt( "SET requires t or sec" );

  const double v = param.requires_dbl( "v" );

  store.set_sample( key , msec , v );
}


void proc_reset( store_t & store , param_t & param )
{
  std::vector<signal_key_t> keys = signal_list( param );
  for (int i=0; i<keys.size(); i++)
    if ( store.reset_signal( keys[i] ) )
      logger << "  reset " << signal_registry_t::label( keys[i] ) << " to baseline\n";
}


void proc_toggle( store_t & store , param_t & param )
{
  std::vector<signal_key_t> keys = signal_list( param );
  for (int i=0; i<keys.size(); i++)
    if ( store.toggle_visibility( keys[i] ) )
      logger << "  " << signal_registry_t::label( keys[i] )
	     << ( store.timeline().signal( keys[i] ).visible ? " shown" : " hidden" ) << "\n";
}


void proc_zoom( store_t & store , param_t & param )
{
  const signal_key_t key = one_signal( param );

  const double dur = store.timeline().duration;

  // free range
  if ( param.has( "start" ) && param.has( "end" ) )
    {
      store.set_zoom( key , zoom_t::range( param.requires_dbl( "start" ) , param.requires_dbl( "end" ) , dur ) );
    }
  else
    {
      zoom_scale_t scale = ZOOM_FULL;
      if ( ! globals::zoom_scale( param.requires( "scale" ) , &scale ) )
	Helper::halt( "bad zoom scale " + param.value( "scale" ) + ", expecting full, 5s, 30s, 5m or 10m" );

      if ( param.has( "start" ) )
	store.set_zoom( key , zoom_t::make( scale , param.requires_dbl( "start" ) , dur ) );
      else
	store.set_zoom_preset( key , scale );
    }

  if ( store.timeline().has( key ) )
    {
      const zoom_t & z = store.timeline().signal( key ).zoom;
      logger << "  " << signal_registry_t::label( key ) << " view " << globals::zoom_label( z.scale )
	     << " [" << z.start << "s, " << z.end << "s]\n";
    }
}


void proc_cascade( store_t & store , param_t & param )
{
  store.set_cascade( param.has( "on" ) ? param.yesno( "on" ) : true );
  logger << "  cascade " << ( store.cascade() ? "on" : "off" ) << "\n";
}


void proc_sync( store_t & store , param_t & param )
{
  store.set_zoom_sync( param.has( "on" ) ? param.yesno( "on" ) : true );
  logger << "  zoom sync " << ( store.zoom_sync() ? "on" : "off" ) << "\n";
}


void proc_undo( store_t & store , param_t & param )
{
  if ( ! store.undo() ) Helper::warn( "nothing to undo" );
}


void proc_redo( store_t & store , param_t & param )
{
  if ( ! store.redo() ) Helper::warn( "nothing to redo" );
}


void proc_import( store_t & store , param_t & param )
{
  const std::string file = param.requires( "file" );
  std::string errmsg;
  if ( ! store.import_csv( file , &errmsg ) )
    {
      Helper::warn( "could not import " + file + ": " + errmsg );
      globals::retcode = 1;
    }
}


void proc_export( store_t & store , param_t & param )
{

  std::vector<std::string> cols;

  if ( param.has( "cols" ) && Helper::iequals( param.value( "cols" ) , "all" ) )
    cols = signal_registry_t::headers();
  else if ( param.has( "cols" ) )
    {
      cols = param.strvector( "cols" );
      const std::vector<std::string> & req = signal_registry_t::required_columns();
      for (int i=0; i<req.size(); i++)
	if ( std::find( cols.begin() , cols.end() , req[i] ) == cols.end() )
	  Helper::warn( "export columns do not include " + req[i] );
    }
  else
    {
      cols = signal_registry_t::required_columns();
      std::vector<signal_key_t> v = store.timeline().visible();
      for (int i=0; i<v.size(); i++) cols.push_back( signal_registry_t::label( v[i] ) );
    }

  if ( ! param.has( "file" ) )
    {
      std::cout << csv::to_csv( cols , store.export_rows( cols ) , globals::csv_delimiter );
      return;
    }

  const std::string file = param.value( "file" );
  std::string errmsg;
  if ( ! store.export_csv( file , cols , &errmsg ) )
    {
      Helper::warn( errmsg );
      globals::retcode = 1;
      return;
    }

  logger << "  wrote " << store.timeline().size() << " rows, "
	 << cols.size() << " columns to " << file << "\n";
}


void proc_desc( store_t & store , param_t & param )
{

  const timeline_t & t = store.timeline();

  logger << "  duration        : " << t.duration << "s (" << Helper::timestring( grid::duration_msec( t.duration ) ) << ")\n"
	 << "  sample rate     : " << t.sr << "ms\n"
	 << "  samples/signal  : " << t.size() << "\n"
	 << "  cascade         : " << ( store.cascade() ? "on" : "off" ) << "\n"
	 << "  zoom sync       : " << ( store.zoom_sync() ? "on" : "off" ) << "\n"
	 << "  undo/redo       : " << store.undo_size() << "/" << store.redo_size() << "\n";

  std::map<signal_key_t,signal_state_t>::const_iterator ss = t.signals.begin();
  while ( ss != t.signals.end() )
    {
      const signal_def_t & def = signal_registry_t::def( ss->first );
      const signal_state_t & s = ss->second;

      int nmod = 0;
      double mn = def.pmax , mx = def.pmin;
      for (int i=0; i<s.data.size(); i++)
	{
	  if ( s.data[i].modified ) ++nmod;
	  if ( s.data[i].value < mn ) mn = s.data[i].value;
	  if ( s.data[i].value > mx ) mx = s.data[i].value;
	}

      logger << "  " << def.label << " (" << def.unit << ")"
	     << "\torder=" << s.order
	     << "\t" << ( s.visible ? "visible" : "hidden" )
	     << "\tcps=" << s.cps.size()
	     << "\tmodified=" << nmod
	     << "\trange=" << mn << ".." << mx
	     << "\tview=" << globals::zoom_label( s.zoom.scale ) << "\n";
      ++ss;
    }

}


void proc_dump( store_t & store , param_t & param )
{

  const signal_key_t key = one_signal( param );

  if ( ! store.timeline().has( key ) )
    {
      Helper::warn( signal_registry_t::label( key ) + " has not been selected or initialized" );
      return;
    }

  const signal_state_t & s = store.timeline().signal( key );

  // control points only
  const bool cps = param.has( "cps" );

  const std::vector<data_point_t> & d = cps ? s.cps : s.data;

  for (int i=0; i<d.size(); i++)
    std::cout << Helper::timestring( d[i].msec ) << "\t"
	      << d[i].msec << "\t"
	      << d[i].value << "\t"
	      << ( d[i].modified ? 1 : 0 ) << "\n";
}

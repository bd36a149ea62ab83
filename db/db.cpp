//    --------------------------------------------------------------------
//
//    This file is part of eegprep.
//
//    eegprep is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    eegprep is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with eegprep. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "db/db.h"

#include "helper/logger.h"

#include <ctime>

extern logger_t logger;


std::string strata_t::print() const
{
  if ( levels.size() == 0 ) return ".";

  std::stringstream ss;
  std::map<factor_t,level_t>::const_iterator aa = levels.begin();
  while ( aa != levels.end() )
    {
      if ( aa != levels.begin() ) ss << ";";
      ss << aa->first.factor_name << "/" << aa->second.level_name ; 
      ++aa;
    }
  return ss.str();
}


//
// StratOutDBase
//

bool StratOutDBase::attach( const std::string & n )
{
  
  if ( attached() ) dettach();

  sql.open( n ); 
  
  sql.synchronous( false );
  
  filename = n;
  
  //
  // Tables
  //

  sql.query(" CREATE TABLE IF NOT EXISTS factors("
            "   factor_id   INTEGER PRIMARY KEY , "
	    "   factor_name VARCHAR(20) NOT NULL , "
	    "   is_numeric  INTEGER ) ; " ); 

  sql.query(" CREATE TABLE IF NOT EXISTS levels("
            "   level_id   INTEGER PRIMARY KEY , "
	    "   factor_id  INTEGER NOT NULL , "
	    "   level_name VARCHAR(20) ) ; " ); 

  // a strata is a specific combination of factor levels; the
  // baseline (no factors) has a single row with level_id 0
  
  sql.query(" CREATE TABLE IF NOT EXISTS strata("
            "   strata_id    INTEGER NOT NULL , "
	    "   level_id     INTEGER NOT NULL ); " );
  
  sql.query(" CREATE TABLE IF NOT EXISTS variables("
            "   variable_id    INTEGER PRIMARY KEY , "
	    "   variable_name  VARCHAR(20) NOT NULL , "
	    "   command_name   VARCHAR(20) , "
	    "   variable_label VARCHAR(20) ); " ); 
  
  sql.query(" CREATE TABLE IF NOT EXISTS individuals("
	    "   indiv_id    INTEGER PRIMARY KEY , "
	    "   indiv_name  VARCHAR(20) NOT NULL , "
	    "   file_name   VARCHAR(20) ); " ); 
  
  sql.query(" CREATE TABLE IF NOT EXISTS commands("
	    "   cmd_id          INTEGER PRIMARY KEY , "
	    "   cmd_name        VARCHAR(20) NOT NULL , "
	    "   cmd_number      INTEGER NOT NULL , "
	    "   cmd_timestamp   VARCHAR(20) NOT NULL , "
	    "   cmd_parameters  VARCHAR(20)  ); " ); 

  sql.query(" CREATE TABLE IF NOT EXISTS datapoints("
	    "   indiv_id      INTEGER NOT NULL , "
	    "   cmd_id        INTEGER NOT NULL , "
	    "   variable_id   INTEGER NOT NULL , "	    
	    "   strata_id     INTEGER , "
	    "   value         NUMERIC ); " );

  init();
  
  return true;
}

bool StratOutDBase::dettach()
{
  if ( ! attached() ) return false;
  release();
  sql.close();
  filename = "";
  return true;
}

bool StratOutDBase::init()
{
  stmt_insert_indiv     = sql.prepare(" INSERT INTO individuals ( indiv_name , file_name ) values( :indiv_name , :file_name ) ; ");
  stmt_insert_variable  = sql.prepare(" INSERT INTO variables ( variable_name , command_name , variable_label ) values( :var_name, :cmd_name , :var_label ) ; ");
  stmt_insert_command   = sql.prepare(" INSERT INTO commands ( cmd_name , cmd_number, cmd_timestamp, cmd_parameters ) "
				      " values( :cmd_name , :cmd_number, :cmd_timestamp, :cmd_parameters ) ; ");
  stmt_insert_factor    = sql.prepare(" INSERT INTO factors ( factor_name , is_numeric ) values( :fac_name, :is_num ) ; ");
  stmt_insert_level     = sql.prepare(" INSERT INTO levels ( level_name , factor_id ) values( :level_name, :fac_id ) ; ");
  stmt_insert_stratum   = sql.prepare(" INSERT INTO strata ( strata_id , level_id ) values( :strata_id, :level_id ) ; ");
  stmt_insert_value     = sql.prepare(" INSERT INTO datapoints ( indiv_id, cmd_id, variable_id, strata_id, value ) "
				      " values( :indiv_id, :cmd_id, :variable_id, :strata_id, :value ) ; ");  
  return true;
}

bool StratOutDBase::release()
{
  sql.finalise( stmt_insert_indiv );
  sql.finalise( stmt_insert_factor );   
  sql.finalise( stmt_insert_level );    
  sql.finalise( stmt_insert_stratum );  
  sql.finalise( stmt_insert_command );  
  sql.finalise( stmt_insert_variable ); 
  sql.finalise( stmt_insert_value );    
  stmt_insert_indiv = stmt_insert_factor = stmt_insert_level = stmt_insert_stratum = NULL;
  stmt_insert_command = stmt_insert_variable = stmt_insert_value = NULL;
  return true;
}

indiv_t StratOutDBase::insert_individual( const std::string & indiv_name , const std::string & file_name )
{
  sql.bind_text( stmt_insert_indiv , ":indiv_name" , indiv_name );
  sql.bind_text( stmt_insert_indiv , ":file_name" , file_name );
  sql.step( stmt_insert_indiv );
  sql.reset( stmt_insert_indiv );

  indiv_t indiv;
  indiv.indiv_name = indiv_name;
  indiv.file_name = file_name;
  indiv.indiv_id = sql.last_insert_rowid();
  return indiv;
}

var_t StratOutDBase::insert_variable( const std::string & var_name, const std::string & cmd_name , const std::string & var_label )
{
  sql.bind_text( stmt_insert_variable , ":var_name" , var_name );
  sql.bind_text( stmt_insert_variable , ":cmd_name" , cmd_name );
  sql.bind_text( stmt_insert_variable , ":var_label" , var_label );
  sql.step( stmt_insert_variable );
  sql.reset( stmt_insert_variable );

  var_t var;
  var.var_id = sql.last_insert_rowid();
  var.var_name = var_name;
  var.var_label = var_label;
  return var;
}

factor_t StratOutDBase::insert_factor( const std::string & fac_name, const bool is_numeric )
{
  sql.bind_text( stmt_insert_factor , ":fac_name" , fac_name );
  sql.bind_int( stmt_insert_factor , ":is_num" , is_numeric );
  sql.step( stmt_insert_factor );
  sql.reset( stmt_insert_factor );

  factor_t factor;
  factor.factor_id = sql.last_insert_rowid();
  factor.factor_name = fac_name;
  factor.is_numeric = is_numeric;
  return factor;
}

level_t StratOutDBase::insert_level( const std::string & level_name, const int factor_id )
{
  sql.bind_text( stmt_insert_level , ":level_name" , level_name );
  sql.bind_int( stmt_insert_level , ":fac_id" , factor_id );
  sql.step( stmt_insert_level );
  sql.reset( stmt_insert_level );

  level_t level;  
  level.level_id = sql.last_insert_rowid();
  level.level_name = level_name;
  level.factor_id = factor_id;
  return level;
}

strata_t StratOutDBase::insert_strata( const strata_t & s , const int strata_id )
{
  
  strata_t strata;
  strata.strata_id = strata_id;
  strata.levels = s.levels;

  std::map<factor_t,level_t>::const_iterator ll = s.levels.begin();
  while ( ll != s.levels.end() )
    {        
      sql.bind_int( stmt_insert_stratum , ":strata_id" , strata.strata_id );
      sql.bind_int( stmt_insert_stratum , ":level_id" , ll->second.level_id );
      sql.step( stmt_insert_stratum );
      sql.reset( stmt_insert_stratum );
      ++ll;
    }

  // root strata (no stratifying variables): level code 0
  if ( s.levels.size() == 0 )
    {
      sql.bind_int( stmt_insert_stratum , ":strata_id" , strata.strata_id );
      sql.bind_int( stmt_insert_stratum , ":level_id" , 0 );
      sql.step( stmt_insert_stratum );
      sql.reset( stmt_insert_stratum );
    }
  
  return strata;
}

command_t StratOutDBase::insert_command( const std::string & cmd_name , int cmd_number, const std::string & timedate , const std::string & cmd_param )
{
  sql.bind_text( stmt_insert_command , ":cmd_name" , cmd_name );
  sql.bind_int( stmt_insert_command , ":cmd_number" , cmd_number );
  sql.bind_text( stmt_insert_command , ":cmd_timestamp" , timedate );
  sql.bind_text( stmt_insert_command , ":cmd_parameters" , cmd_param );
  sql.step( stmt_insert_command );
  sql.reset( stmt_insert_command );
  
  command_t command;
  command.cmd_id = sql.last_insert_rowid();
  command.cmd_name = cmd_name;
  command.cmd_number = cmd_number;
  command.timestamp = timedate;
  command.cmd_parameters = cmd_param;
  return command;
}

void StratOutDBase::insert_value( const int indiv_id , const int cmd_id , const int variable_id , 
				  const int strata_id , const value_t & x )
{
  sql.bind_int( stmt_insert_value , ":indiv_id" , indiv_id );
  sql.bind_int( stmt_insert_value , ":cmd_id" , cmd_id );
  sql.bind_int( stmt_insert_value , ":variable_id" , variable_id );

  if ( strata_id == -1 ) 
    sql.bind_null( stmt_insert_value , ":strata_id" );
  else
    sql.bind_int( stmt_insert_value , ":strata_id" , strata_id );
  
  if      ( x.missing ) sql.bind_null( stmt_insert_value ,   ":value" );
  else if ( x.numeric ) sql.bind_double( stmt_insert_value , ":value" , x.d );
  else if ( x.integer ) sql.bind_int( stmt_insert_value ,    ":value" , x.i );
  else                  sql.bind_text( stmt_insert_value ,   ":value" , x.s );
  
  sql.step( stmt_insert_value );
  sql.reset( stmt_insert_value );
}


//
// writer_t
//

std::string writer_t::timestamp()
{
  time_t rawtime;
  time( &rawtime );
  struct tm * timeinfo = localtime( &rawtime );
  char BUFFER[50];
  strftime( BUFFER , sizeof(BUFFER) , "%d-%b-%Y %H:%M:%S" , timeinfo );
  return BUFFER;
}

bool writer_t::attach( const std::string & filename )
{
  close();

  db.attach( filename );
  dbless = false;

  // wrap all inserts in one transaction; committed on close()
  db.begin();
  
  // baseline strata is always 1
  strata_t baseline;
  if ( get_strata_id( baseline ) != 1 ) 
    Helper::halt( "internal problem with root strata_id != 1" );
  
  logger << "  writing output to " << filename << "\n";

  return db.attached();
}

bool writer_t::close()
{
  if ( ! dbless ) 
    {
      db.commit();
      db.dettach();
    }
  
  dbless = true;
  cmd_number = 0;
  factors.clear();
  levels.clear();
  strata.clear();
  variables.clear();
  individuals.clear();
  curr_indiv.clear();
  curr_command.clear();
  curr_strata.clear();
  return true;
}

bool writer_t::id( const std::string & indiv_name , const std::string & file_name )
{
  std::map<std::string,indiv_t>::const_iterator ii = individuals.find( indiv_name );
  if ( ii != individuals.end() ) 
    {
      curr_indiv = ii->second;
      return true;
    }

  if ( dbless ) 
    {
      curr_indiv.indiv_id = individuals.size() + 1;
      curr_indiv.indiv_name = indiv_name;
      curr_indiv.file_name = file_name;
    }
  else
    curr_indiv = db.insert_individual( indiv_name , file_name );

  individuals[ indiv_name ] = curr_indiv;
  return true;
}

bool writer_t::cmd( const std::string & cmd_name , const std::string & param )
{
  ++cmd_number;
  
  if ( dbless )
    {
      curr_command.cmd_id = cmd_number;
      curr_command.cmd_number = cmd_number;
      curr_command.cmd_name = cmd_name;
      curr_command.cmd_parameters = param;
    }
  else
    curr_command = db.insert_command( cmd_name , cmd_number , timestamp() , param );

  // new command, baseline strata
  unlevel();
  return true;
}

factor_t writer_t::get_factor( const std::string & fac_name )
{
  std::map<std::string,factor_t>::const_iterator ff = factors.find( fac_name );
  if ( ff != factors.end() ) return ff->second;

  factor_t factor( fac_name );
  if ( dbless ) 
    factor.factor_id = factors.size() + 1;
  else
    factor = db.insert_factor( fac_name , false );
  
  factors[ fac_name ] = factor;
  return factor;
}

bool writer_t::level( const int level_name , const std::string & factor_name )
{
  return level( Helper::int2str( level_name ) , factor_name );
}

bool writer_t::level( const std::string & level_name , const std::string & factor_name )
{
  
  factor_t factor = get_factor( factor_name );
  
  // for level, use level.factor as the lookup key
  const std::string level_key = level_name + "." + factor_name ;
  
  std::map<std::string,level_t>::const_iterator ll = levels.find( level_key );
  
  level_t level;
  if ( ll != levels.end() ) 
    level = ll->second;
  else
    {
      if ( dbless ) 
	{
	  level.level_id = levels.size() + 1;
	  level.level_name = level_name;
	  level.factor_id = factor.factor_id;
	}
      else
	level = db.insert_level( level_name , factor.factor_id );
      levels[ level_key ] = level;
    }
  
  // swap/add to current strata
  curr_strata.insert( level , factor );
  return true;
}

bool writer_t::unlevel( const std::string & factor_name )
{
  std::map<std::string,factor_t>::const_iterator ff = factors.find( factor_name );
  if ( ff == factors.end() ) return false;
  curr_strata.drop( ff->second.factor_id );
  return true;
}

bool writer_t::unlevel() 
{
  curr_strata.clear();
  return true;
}

int writer_t::get_strata_id( const strata_t & s )
{
  std::map<strata_t,int>::const_iterator ss = strata.find( s );
  if ( ss != strata.end() ) return ss->second;

  const int strata_id = strata.size() + 1;
  if ( ! dbless ) db.insert_strata( s , strata_id );
  strata[ s ] = strata_id;
  return strata_id;
}

bool writer_t::value( const std::string & var_name , double d , const std::string & desc )
{
  return value( var_name , value_t( d ) , desc );
}

bool writer_t::value( const std::string & var_name , int i , const std::string & desc )
{
  return value( var_name , value_t( i ) , desc );
}

bool writer_t::value( const std::string & var_name , const std::string & s , const std::string & desc )
{
  return value( var_name , value_t( s ) , desc );
}

bool writer_t::missing_value( const std::string & var_name , const std::string & desc )
{
  return value( var_name , value_t() , desc );
}

bool writer_t::value( const std::string & var_name , const value_t & x , const std::string & desc )
{
  
  if ( dbless ) return to_stdout( var_name , x );

  // use 'command:var' as the unique identifier
  const std::string var_key = curr_command.cmd_name + ":" + var_name;

  std::map<std::string,int>::const_iterator vv = variables.find( var_key );
  int var_id;
  if ( vv != variables.end() ) 
    var_id = vv->second;
  else
    {
      var_t var = db.insert_variable( var_name , curr_command.cmd_name , desc == "" ? "." : desc );
      var_id = var.var_id;
      variables[ var_key ] = var_id;
    }
  
  const int strata_id = get_strata_id( curr_strata );
  
  db.insert_value( curr_indiv.indiv_id , 
		   curr_command.cmd_id , 	
		   var_id , 		     
		   curr_strata.empty() ? -1 : strata_id , 
		   x );
  return true;
}

bool writer_t::to_stdout( const std::string & var_name , const value_t & x )  
{
  out << curr_indiv.indiv_name << "\t"
      << curr_command.cmd_name << "\t"
      << curr_strata.print() << "\t" 
      << var_name << "\t" 
      << x.str() 
      << "\n";
  return true;
}

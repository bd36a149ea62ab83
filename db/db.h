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

#ifndef __EEGPREP_DB_H__
#define __EEGPREP_DB_H__

#include "db/sqlwrap.h"

#include <string>
#include <map>
#include <set>
#include <vector>
#include <iostream>
#include <sstream>

#include "helper/helper.h"

class writer_t;

  
//
// factors, levels, strata, variables, individuals, commands, values
//

struct factor_t {
  
  factor_t() : factor_id( -1 ) , is_numeric( false ) { }   
  
  factor_t( const std::string & factor_name ) : factor_id( -1 ) , factor_name( factor_name ) , is_numeric( false ) { } 
  
  int factor_id;
  std::string factor_name;
  bool is_numeric;
  bool operator< ( const factor_t & rhs ) const { return factor_id < rhs.factor_id; }
};
  
struct level_t { 
  level_t() { level_id = -1; factor_id = -1; level_name = "."; } 
  int level_id;
  int factor_id;
  std::string level_name;  
  bool operator< ( const level_t & rhs ) const 
  {
    if ( factor_id == rhs.factor_id ) return level_id < rhs.level_id;
    return factor_id < rhs.factor_id;
  }  
};
  
struct indiv_t {
  indiv_t() { clear(); } 
  void clear() { indiv_id = -1; indiv_name = "."; file_name = ""; }
  int indiv_id;
  std::string indiv_name;
  std::string file_name;
};
  
struct command_t {
  command_t() { clear(); } 
  void clear() { cmd_id = -1; cmd_number = -1; cmd_name = "."; cmd_parameters = ""; timestamp = ""; }
  int cmd_id;
  int cmd_number;
  std::string cmd_name;
  std::string cmd_parameters;
  std::string timestamp;
};


struct strata_t
{
  strata_t() { strata_id = -1; } 
  int strata_id;
  
  // factor_id --> level_id // i.e. can only have 1 level of each factor
  std::map<factor_t,level_t> levels;
  
  void clear() { levels.clear(); }
  void insert( const level_t & l , const factor_t & f ) { levels[f] = l; }
  bool empty() const { return levels.size() == 0; } 
  bool operator<( const strata_t & rhs ) const
  {
    if ( levels.size() != rhs.levels.size() ) return levels.size() < rhs.levels.size();
    std::map<factor_t,level_t>::const_iterator ii = levels.begin();
    std::map<factor_t,level_t>::const_iterator jj = rhs.levels.begin();
    while ( ii != levels.end() ) 
      {
	if ( ii->first < jj->first ) return true;
	if ( jj->first < ii->first ) return false;
	
	if ( ii->second < jj->second ) return true;
	if ( jj->second < ii->second ) return false;
	
	++ii; ++jj;
      }
    return false;
  }
  
  // e.g. CH/Fp1;IC/3, or '.'
  std::string print() const;
  
  void drop( int factor_id )
  {            
    std::map<factor_t,level_t> levels_copy = levels;
    levels.clear();      
    std::map<factor_t,level_t>::const_iterator ii = levels_copy.begin();
    while ( ii != levels_copy.end() )
      {
	if ( ii->first.factor_id != factor_id ) levels[ ii->first ] = ii->second;
	++ii;
      }      
  }
  
};

  
struct var_t
{
  int var_id;
  std::string var_name;
  std::string var_label;
};

struct value_t
{ 
  value_t( const std::string & s ) : numeric(false) , integer(false), missing( false ) , d(0) , s(s) , i(0) { } 
  value_t( double d ) : numeric(true) , integer(false) , missing( false ), d(d) , i(0) { } 
  value_t( int i ) : numeric(false) , integer(true) , missing(false) , d(0) , i(i) { } 
  value_t() : numeric(false) , integer(false) , missing(true) , d(0) , i(0) { } 

  bool numeric;
  bool integer;
  bool missing;

  double d;
  std::string s;
  int i;

  std::string str() const 
  {
    std::stringstream ss;
    if ( missing ) ss << "NA";    
    else if ( numeric ) ss << d;
    else if ( integer ) ss << i;
    else ss << s;
    return ss.str();
  }

};



//
// SQLite store
//

class StratOutDBase {  
  
 public:
  
  StratOutDBase() : 
    stmt_insert_indiv( NULL ) , stmt_insert_variable( NULL ) , stmt_insert_command( NULL ) , 
    stmt_insert_factor( NULL ) , stmt_insert_level( NULL ) , stmt_insert_stratum( NULL ) , 
    stmt_insert_value( NULL ) { } 
  
  ~StratOutDBase() { dettach(); }
  
  bool attach( const std::string & name );

  bool dettach();
  
  bool attached() const { return sql.is_open(); }

  std::string name() const { return filename; } 
  
  void begin() { sql.begin(); } 
  void commit() { sql.commit(); } 

  indiv_t   insert_individual( const std::string & indiv_name , const std::string & file_name );
  command_t insert_command( const std::string & cmd_name , int cmd_number, const std::string & timedate , const std::string & cmd_param );
  var_t     insert_variable( const std::string & var_name , const std::string & cmd_name , const std::string & var_label );
  factor_t  insert_factor( const std::string & fac_name , const bool is_numeric );
  level_t   insert_level( const std::string & level_name , const int factor_id );
  strata_t  insert_strata( const strata_t & s , const int strata_id );
  void      insert_value( const int indiv_id , const int cmd_id , const int variable_id , const int strata_id , const value_t & x );

 private:

  bool init();
  bool release();
  
  SQL sql;
  
  std::string filename;
  
  sqlite3_stmt * stmt_insert_indiv;
  sqlite3_stmt * stmt_insert_variable;
  sqlite3_stmt * stmt_insert_command;
  sqlite3_stmt * stmt_insert_factor;
  sqlite3_stmt * stmt_insert_level;
  sqlite3_stmt * stmt_insert_stratum;
  sqlite3_stmt * stmt_insert_value;
  
};



//
// writer_t: stratified output, either as plain text lines 
//
//   ID  CMD  F1/L1;F2/L2  VAR  VALUE
//
// or into an SQLite database (attach)
//

class writer_t 
{
  
 public:

  writer_t( std::ostream & out = std::cout ) : out( out ) , dbless( true ) , cmd_number( 0 ) { } 
  
  ~writer_t() { close(); } 

  bool attach( const std::string & filename );
  
  bool close();

  bool attached() const { return ! dbless; } 
  
  std::string name() const { return dbless ? "." : db.name(); } 
  
  // current individual
  bool id( const std::string & indiv_name , const std::string & file_name );

  // current command (numbered in order)
  bool cmd( const std::string & cmd_name , const std::string & param = "" );
  
  // add to / drop from the current strata
  bool level( const int level_name , const std::string & factor_name );
  bool level( const std::string & level_name , const std::string & factor_name );
  bool unlevel( const std::string & factor_name );
  bool unlevel();

  bool value( const std::string & var_name , double d , const std::string & desc = "" );
  bool value( const std::string & var_name , int i , const std::string & desc = "" );
  bool value( const std::string & var_name , const std::string & s , const std::string & desc = "" );
  bool missing_value( const std::string & var_name , const std::string & desc = "" );

 private:

  writer_t( const writer_t & );
  writer_t & operator=( const writer_t & );
  
  bool value( const std::string & var_name , const value_t & x , const std::string & desc );

  bool to_stdout( const std::string & var_name , const value_t & x );

  int get_strata_id( const strata_t & s );

  factor_t get_factor( const std::string & fac_name );
  
  static std::string timestamp();
  
  std::ostream & out;

  bool dbless;

  StratOutDBase db;

  int cmd_number;

  // caches (text mode uses the same ids, without a database)
  
  std::map<std::string,factor_t> factors;
  std::map<std::string,level_t> levels;
  std::map<strata_t,int> strata;
  std::map<std::string,int> variables;
  std::map<std::string,indiv_t> individuals;
  
  indiv_t curr_indiv;
  command_t curr_command;
  strata_t curr_strata;
  
};

#endif

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

#include <catch2/catch.hpp>

#include "db/db.h"
#include "db/sqlwrap.h"
#include "helper/helper.h"
#include "defs/defs.h"
#include "helper/errors.h"
#include "tests/test_support.h"

#include <sstream>

TEST_CASE( "text output is one tab-delimited row per value" , "[db]" )
{
  std::stringstream ss;
  writer_t writer( ss );
  REQUIRE_FALSE( writer.attached() );
  
  writer.id( "rec1" , "rec1.edf" );
  writer.cmd( "ICA" );
  writer.value( "NC" , 4 );
  writer.level( 2 , globals::ic_strat );
  writer.level( "Fp1" , globals::signal_strat );
  writer.value( "R" , 0.75 );
  writer.unlevel( globals::ic_strat );
  writer.value( "LAB" , std::string( "x" ) );
  
  std::vector<std::string> lines;
  std::string line;
  while ( std::getline( ss , line ) ) lines.push_back( line );

  REQUIRE( lines.size() == 3 );
  REQUIRE( lines[0] == "rec1\tICA\t.\tNC\t4" );

  std::vector<std::string> tok = Helper::char_split( lines[1] , '\t' );
  REQUIRE( tok.size() == 5 );
  REQUIRE( tok[2].find( globals::ic_strat + "/2" ) != std::string::npos );
  REQUIRE( tok[2].find( globals::signal_strat + "/Fp1" ) != std::string::npos );
  REQUIRE( tok[3] == "R" );

  tok = Helper::char_split( lines[2] , '\t' );
  REQUIRE( tok[2] == globals::signal_strat + "/Fp1" );
}

TEST_CASE( "database output" , "[db]" )
{
  const std::string f = testing::tmpfile( "out.db" );

  {
    std::stringstream ss;
    writer_t writer( ss );
    writer.attach( f );
    REQUIRE( writer.attached() );
    
    writer.id( "rec1" , "rec1.edf" );
    writer.cmd( "READ" );
    writer.value( "NS" , 5 );
    writer.value( "SR" , 250.0 );
    writer.cmd( "EOG" );
    writer.value( "STATUS" , std::string( "DETECTED" ) );
    for (int i=1;i<=3;i++)
      {
	writer.level( i , globals::ic_strat );
	writer.value( "R" , 0.1 * i );
      }
    writer.unlevel();
    writer.missing_value( "REASON" );
    writer.close();

    // nothing goes to the stream once attached
    REQUIRE( ss.str() == "" );
  }

  SQL sql;
  sql.open( f );
  REQUIRE( sql.table_exists( "datapoints" ) );
  REQUIRE( sql.lookup_int( "SELECT COUNT(*) FROM datapoints ;" ) == 7 );
  REQUIRE( sql.lookup_int( "SELECT COUNT(*) FROM commands ;" ) == 2 );
  REQUIRE( sql.lookup_int( "SELECT COUNT(*) FROM individuals ;" ) == 1 );
  REQUIRE( sql.lookup_int( "SELECT COUNT(*) FROM variables WHERE variable_name = 'R' ;" ) == 1 );
  // baseline values carry no strata
  REQUIRE( sql.lookup_int( "SELECT COUNT(*) FROM datapoints WHERE strata_id IS NULL ;" ) == 4 );
  REQUIRE( sql.lookup_int( "SELECT COUNT(DISTINCT strata_id) FROM datapoints ;" ) == 3 );
  sql.close();
}

TEST_CASE( "bad SQL halts" , "[db]" )
{
  SQL sql;
  sql.open( testing::tmpfile( "bad.db" ) );
  REQUIRE_THROWS_AS( sql.query( "SELEKT nonsense ;" ) , eegprep::eegprep_error );
  REQUIRE( sql.lookup_int( "SELECT 42 ;" ) == 42 );
  REQUIRE( SQL::library_version() != "" );
}

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

#include "graphics/plots.h"
#include "helper/errors.h"
#include "helper/helper.h"
#include "ica/ica.h"
#include "tests/test_support.h"

#include <fstream>
#include <sstream>

static std::string slurp( const std::string & f )
{
  std::ifstream I( f.c_str() );
  std::stringstream ss;
  ss << I.rdbuf();
  return ss.str();
}

static int count( const std::string & s , const std::string & pat )
{
  int n = 0;
  std::string::size_type p = s.find( pat );
  while ( p != std::string::npos ) { ++n; p = s.find( pat , p + 1 ); }
  return n;
}

TEST_CASE( "colors and escaping" , "[plots]" )
{
  REQUIRE( rgb_t( 1 , 0 , 0 ).hex() == "#ff0000" );
  REQUIRE( rgb_t( 0 , 0.5 , 1 ).hex() == "#0080ff" );
  REQUIRE( rgb_t::palette( 0 ).hex() == rgb_t::palette( 10 ).hex() );
  REQUIRE( html_plot_t::escape( "a<b & \"c\"" ) == "a&lt;b &amp; &quot;c&quot;" );
}

TEST_CASE( "long traces are thinned" , "[plots]" )
{
  REQUIRE( html_plot_t::decimation( 100 , 5000 ) == 1 );
  REQUIRE( html_plot_t::decimation( 5000 , 5000 ) == 1 );
  REQUIRE( html_plot_t::decimation( 5001 , 5000 ) == 2 );
  REQUIRE( html_plot_t::decimation( 75000 , 5000 ) == 15 );
}

TEST_CASE( "signal plots are self-contained pages" , "[plots]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 30 , true );
  
  const std::string f = testing::tmpfile( "raw.html" );
  eegprep::render_raw( s , f );

  REQUIRE( Helper::fileExists( f ) );
  REQUIRE( Helper::file_size( f ) > 500 );

  const std::string html = slurp( f );
  REQUIRE( html.find( "Raw EEG Signal (first 5 channels, 10s)" ) != std::string::npos );
  REQUIRE( html.find( "<svg" ) != std::string::npos );
  REQUIRE( html.find( "<script" ) != std::string::npos );
  REQUIRE( html.find( "<script src" ) == std::string::npos );
  REQUIRE( count( html , "<polyline" ) == 5 );
  REQUIRE( html.find( ">EOG<" ) != std::string::npos );

  const std::string g = testing::tmpfile( "clean.html" );
  eegprep::render_cleaned( s , g );
  REQUIRE( slurp( g ).find( "Cleaned EEG Signal (first 5 channels, 10s)" ) != std::string::npos );
}

TEST_CASE( "short recordings plot what there is" , "[plots]" )
{
  std::vector<std::string> labels;
  labels.push_back( "C3" );
  labels.push_back( "C4" );
  eegprep::series_t s = testing::blank( labels , 100 , 300 );

  const std::string f = testing::tmpfile( "short.html" );
  eegprep::render_raw( s , f );
  REQUIRE( count( slurp( f ) , "<polyline" ) == 2 );
}

TEST_CASE( "component plots show up to ten sources" , "[plots]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , true );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );
  
  const std::string f = testing::tmpfile( "ics.html" );
  eegprep::render_components( m , s , f );

  const std::string html = slurp( f );
  REQUIRE( html.find( "ICA Components (first 10)" ) != std::string::npos );
  REQUIRE( count( html , "<polyline" ) == m.nc );
  REQUIRE( html.find( "ICA 1" ) != std::string::npos );
}

TEST_CASE( "plot write failures" , "[plots]" )
{
  html_plot_t empty( "t" , "x" , "y" );
  REQUIRE_THROWS_AS( empty.write( testing::tmpfile( "empty.html" ) ) , eegprep::eegprep_error );

  html_plot_t p( "t" , "x" , "y" );
  p.add( "a" , std::vector<double>( 3 , 1.0 ) , std::vector<double>( 3 , 2.0 ) , 0 );
  REQUIRE_THROWS_AS( p.write( "/no/such/dir/p.html" ) , eegprep::io_failure_error );
}

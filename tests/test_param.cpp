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

#include "param.h"
#include "helper/errors.h"
#include "pipeline/pipeline.h"
#include "tests/test_support.h"

#include <fstream>

TEST_CASE( "param_t parses key=value and bare flags" , "[param]" )
{
  param_t param;
  param.parse( "lwr=0.5" );
  param.parse( "epoch" );
  param.parse( "eog = Fp1,Fp2" );
  param.parse( "title='a=b'" );

  REQUIRE( param.size() == 4 );
  REQUIRE( param.has( "epoch" ) );
  REQUIRE( param.empty( "epoch" ) );
  REQUIRE( param.yesno( "epoch" ) );
  REQUIRE( param.requires_dbl( "lwr" ) == Approx( 0.5 ) );
  REQUIRE( param.value( "title" ) == "a=b" );

  std::vector<std::string> eog = param.strvector( "eog" );
  REQUIRE( eog.size() == 2 );
  REQUIRE( eog[1] == "Fp2" );
}

TEST_CASE( "param_t appends lists with key+=value" , "[param]" )
{
  param_t param;
  param.parse( "eog+=EOG1" );
  param.parse( "eog+=EOG2,HEOG" );

  REQUIRE( param.size() == 1 );
  std::vector<std::string> eog = param.strvector( "eog" );
  REQUIRE( eog.size() == 3 );
  REQUIRE( eog[0] == "EOG1" );
  REQUIRE( eog[2] == "HEOG" );
}

TEST_CASE( "param_t rejects duplicates and unknown keys" , "[param]" )
{
  param_t param;
  param.parse( "nc=10" );
  REQUIRE_THROWS_AS( param.parse( "nc=12" ) , eegprep::eegprep_error );

  param.parse( "bogus=1" );
  REQUIRE_THROWS_AS( param.check( eegprep::options_t::keys() ) , eegprep::eegprep_error );
}

TEST_CASE( "param_t reads a parameter file" , "[param]" )
{
  const std::string f = testing::tmpfile( "params.txt" );
  std::ofstream O( f.c_str() );
  O << "% band\n"
    << "lwr 2\n"
    << "upr=30   % upper edge\n"
    << "\n"
    << "epoch\n";
  O.close();

  param_t param;
  param.read_file( f );
  REQUIRE( param.requires_dbl( "lwr" ) == Approx( 2 ) );
  REQUIRE( param.requires_dbl( "upr" ) == Approx( 30 ) );
  REQUIRE( param.yesno( "epoch" ) );

  param_t missing;
  REQUIRE_THROWS_AS( missing.read_file( testing::tmpfile( "no-such-params.txt" ) ) , eegprep::io_failure_error );
}

TEST_CASE( "options_t defaults and overrides" , "[param][pipeline]" )
{
  eegprep::options_t opt;
  REQUIRE( opt.filter.lwr == 1.0 );
  REQUIRE( opt.filter.upr == 40.0 );
  REQUIRE( opt.ica.nc == 15 );
  REQUIRE( opt.ica.seed == 97 );
  REQUIRE( opt.ica.iteration_bound() == 1000 );
  REQUIRE_FALSE( opt.epoch );

  param_t param;
  param.parse( "upr=30" );
  param.parse( "nc=8" );
  param.parse( "maxit=250" );
  param.parse( "epoch-len=4" );
  param.parse( "eog=LOC,ROC" );
  opt.set( param );

  REQUIRE( opt.filter.upr == 30.0 );
  REQUIRE( opt.ica.nc == 8 );
  REQUIRE( opt.ica.iteration_bound() == 250 );
  REQUIRE( opt.epoch );
  REQUIRE( opt.epoch_length == 4.0 );
  REQUIRE( opt.eog_channels.size() == 2 );

  param_t automax;
  automax.parse( "maxit=auto" );
  eegprep::options_t opt2;
  opt2.set( automax );
  REQUIRE( opt2.ica.iteration_bound() == 1000 );
}

TEST_CASE( "options_t rejects bad values" , "[param][pipeline]" )
{
  eegprep::options_t opt;

  param_t band;
  band.parse( "lwr=40" );
  band.parse( "upr=1" );
  REQUIRE_THROWS_AS( opt.set( band ) , eegprep::eegprep_error );

  param_t nc;
  nc.parse( "nc=0" );
  REQUIRE_THROWS_AS( opt.set( nc ) , eegprep::eegprep_error );

  param_t maxit;
  maxit.parse( "maxit=often" );
  REQUIRE_THROWS_AS( opt.set( maxit ) , eegprep::eegprep_error );
}

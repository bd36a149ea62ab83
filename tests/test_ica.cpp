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

#include "ica/ica.h"
#include "ica/ica-apply.h"
#include "helper/errors.h"
#include "tests/test_support.h"

#include <algorithm>
#include <set>

TEST_CASE( "ICA fits at most one component per channel" , "[ica]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , false );

  eegprep::ica_options_t opt;
  eegprep::ica_model_t m = eegprep::fit_ica( s , opt );

  REQUIRE( m.nc_req == 15 );
  REQUIRE( m.nc == 4 );
  REQUIRE( m.converged );
  REQUIRE( m.iterations <= 1000 );
  REQUIRE( m.unmixing.rows() == 4 );
  REQUIRE( m.unmixing.cols() == 4 );
  REQUIRE( m.mixing.rows() == 4 );
  REQUIRE( m.mixing.cols() == 4 );

  // mixing is a right-inverse of unmixing
  Eigen::MatrixXd I = m.unmixing * m.mixing;
  REQUIRE( ( I - Eigen::MatrixXd::Identity( 4 , 4 ) ).cwiseAbs().maxCoeff() < 1e-8 );
}

TEST_CASE( "EOG channels are not decomposed" , "[ica]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , true );
  REQUIRE( s.types[4] == EOG );
  
  eegprep::ica_options_t opt;
  opt.nc = 3;
  eegprep::ica_model_t m = eegprep::fit_ica( s , opt );

  REQUIRE( m.nc == 3 );
  REQUIRE( m.labels.size() == 4 );
  REQUIRE( std::find( m.labels.begin() , m.labels.end() , "EOG" ) == m.labels.end() );
  REQUIRE( m.sources( s ).rows() == 3 );
  REQUIRE( m.sources( s ).cols() == s.nsamples() );
}

TEST_CASE( "rank-deficient input limits the component count" , "[ica]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , false );
  s.data.row(3) = s.data.row(0) + s.data.row(1);

  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );
  REQUIRE( m.nc == 3 );
}

TEST_CASE( "same seed, same decomposition" , "[ica]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , false );

  eegprep::ica_options_t opt;
  eegprep::ica_model_t a = eegprep::fit_ica( s , opt );
  eegprep::ica_model_t b = eegprep::fit_ica( s , opt );

  REQUIRE( a.iterations == b.iterations );
  REQUIRE( ( a.unmixing - b.unmixing ).cwiseAbs().maxCoeff() < 1e-12 );
}

TEST_CASE( "too few iterations is a convergence failure" , "[ica]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , false );

  eegprep::ica_options_t opt;
  opt.maxit = 1;
  REQUIRE_THROWS_AS( eegprep::fit_ica( s , opt ) , eegprep::nonconvergence_error );
}

TEST_CASE( "ICA needs something to decompose" , "[ica]" )
{
  std::vector<std::string> labels( 1 , "EOG" );
  eegprep::series_t s = testing::blank( labels , 100 , 500 );
  REQUIRE_THROWS_AS( eegprep::fit_ica( s , eegprep::ica_options_t() ) , eegprep::eegprep_error );

  eegprep::ica_options_t opt;
  opt.nc = 0;
  REQUIRE_THROWS_AS( eegprep::fit_ica( testing::blink_mixture( 100 , 5 , false ) , opt ) , eegprep::eegprep_error );
}

TEST_CASE( "reconstruction without exclusions is the identity" , "[ica][apply]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , true );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );
  
  eegprep::series_t r = eegprep::apply_ica( s , m , std::set<int>() );
  REQUIRE( r.labels == s.labels );
  REQUIRE( r.data == s.data );
}

TEST_CASE( "removing every component leaves only the channel means" , "[ica][apply]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , true );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );

  std::set<int> all;
  for (int i=0;i<m.nc;i++) all.insert( i );
  
  eegprep::series_t r = eegprep::apply_ica( s , m , all );

  for (int c=0;c<4;c++)
    for (int i=0;i<r.nsamples();i+=101)
      REQUIRE( r.data(c,i) == Approx( m.means[c] ).margin( 1e-10 ) );

  // EOG passes through untouched
  REQUIRE( r.data.row(4) == s.data.row(4) );
}

TEST_CASE( "out-of-range exclusions are rejected" , "[ica][apply]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , false );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );

  std::set<int> bad;
  bad.insert( m.nc );
  REQUIRE_THROWS_AS( eegprep::apply_ica( s , m , bad ) , eegprep::eegprep_error );

  std::set<int> neg;
  neg.insert( -1 );
  REQUIRE_THROWS_AS( eegprep::apply_ica( s , m , neg ) , eegprep::eegprep_error );
}

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

#include "stats/statistics.h"
#include "stats/eigen_ops.h"
#include "miscmath/miscmath.h"
#include "miscmath/crandom.h"

#include <cmath>

TEST_CASE( "correlation of related and constant vectors" , "[stats]" )
{
  std::vector<double> a , b , c , k;
  for (int i=0;i<100;i++)
    {
      a.push_back( i );
      b.push_back( -2.0 * i + 3 );
      c.push_back( sin( i * 0.3 ) );
      k.push_back( 1.0 );
    }

  REQUIRE( Statistics::correlation( a , a ) == Approx( 1.0 ) );
  REQUIRE( Statistics::correlation( a , b ) == Approx( -1.0 ) );
  REQUIRE( Statistics::correlation( c , c ) == Approx( 1.0 ) );

  double r = 0;
  REQUIRE_FALSE( Statistics::correlation( a , k , &r ) );
  
  std::vector<double> shorter( 10 , 0 );
  REQUIRE_FALSE( Statistics::correlation( a , shorter , &r ) );
}

TEST_CASE( "z-scores use the population SD and skip excluded values" , "[stats]" )
{
  std::vector<double> x;
  x.push_back( 1 );
  x.push_back( 2 );
  x.push_back( 3 );
  x.push_back( 100 );

  std::vector<double> z = Statistics::zscores( x );
  REQUIRE( z.size() == 4 );
  REQUIRE( z[3] > z[2] );

  // without the outlier: mean 2, population SD sqrt(2/3)
  std::vector<bool> ex( 4 , false );
  ex[3] = true;
  z = Statistics::zscores( x , &ex );
  REQUIRE( z[0] == Approx( -1.0 / sqrt( 2.0 / 3.0 ) ) );
  REQUIRE( z[1] == Approx( 0.0 ).margin( 1e-12 ) );
  REQUIRE( z[3] == Approx( 98.0 / sqrt( 2.0 / 3.0 ) ) );

  // constant input gives all zeros
  std::vector<double> k( 5 , 3.0 );
  z = Statistics::zscores( k );
  for (int i=0;i<5;i++) REQUIRE( z[i] == 0 );
}

TEST_CASE( "summary statistics" , "[stats]" )
{
  std::vector<double> x;
  x.push_back( -2 );
  x.push_back( 2 );
  x.push_back( -2 );
  x.push_back( 2 );

  REQUIRE( MiscMath::mean( x ) == Approx( 0 ).margin( 1e-12 ) );
  REQUIRE( MiscMath::rms( x ) == Approx( 2 ) );
  REQUIRE( MiscMath::nextpow2( 1000 ) == 1024 );
  REQUIRE( MiscMath::nextpow2( 1024 ) == 1024 );
}

TEST_CASE( "seeded random numbers repeat" , "[stats]" )
{
  CRandom r1( 97 ) , r2( 97 ) , r3( 98 );

  Eigen::MatrixXd a( 3 , 3 ) , b( 3 , 3 ) , c( 3 , 3 );
  eigen_ops::random_normal( a , r1 );
  eigen_ops::random_normal( b , r2 );
  eigen_ops::random_normal( c , r3 );

  REQUIRE( a == b );
  REQUIRE_FALSE( a == c );
}

TEST_CASE( "rank from singular values" , "[stats]" )
{
  Eigen::VectorXd d( 4 );
  d << 10 , 5 , 1 , 1e-20;
  REQUIRE( eigen_ops::rank( d , 4 ) == 3 );

  d << 0 , 0 , 0 , 0;
  REQUIRE( eigen_ops::rank( d , 4 ) == 0 );
}

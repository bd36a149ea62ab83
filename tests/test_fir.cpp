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

#include "dsp/fir.h"
#include "helper/errors.h"
#include "miscmath/miscmath.h"
#include "stats/statistics.h"
#include "tests/test_support.h"

#include <cmath>

// middle portion, away from the edges
static std::vector<double> middle( const std::vector<double> & x )
{
  const int n = x.size();
  return std::vector<double>( x.begin() + n / 4 , x.begin() + 3 * n / 4 );
}

TEST_CASE( "transition width defaults" , "[fir]" )
{
  eegprep::filter_spec_t spec;
  REQUIRE( spec.transition() == Approx( 1.0 ) );

  eegprep::filter_spec_t spec2( 4.0 , 40.0 );
  REQUIRE( spec2.transition() == Approx( 2.0 ) );

  eegprep::filter_spec_t spec3( 20.0 , 40.0 );
  REQUIRE( spec3.transition() == Approx( 5.0 ) );

  spec3.tw = 0.5;
  REQUIRE( spec3.transition() == Approx( 0.5 ) );
}

TEST_CASE( "band limits are validated against the sample rate" , "[fir]" )
{
  eegprep::filter_spec_t ok( 1 , 40 );
  REQUIRE_NOTHROW( ok.validate( 250 ) );
  REQUIRE_THROWS_AS( ok.validate( 80 ) , eegprep::eegprep_error );

  eegprep::filter_spec_t inverted( 40 , 1 );
  REQUIRE_THROWS_AS( inverted.validate( 250 ) , eegprep::eegprep_error );

  eegprep::filter_spec_t zero( 0 , 40 );
  REQUIRE_THROWS_AS( zero.validate( 250 ) , eegprep::eegprep_error );
}

TEST_CASE( "band-pass design is odd, symmetric and passes the band" , "[fir]" )
{
  std::vector<double> fc = dsptools::design_bandpass_fir( 0.01 , 1.0 , 250 , 1 , 40 );

  REQUIRE( fc.size() % 2 == 1 );
  for (int i=0;i<fc.size()/2;i++) 
    REQUIRE( fc[i] == Approx( fc[ fc.size() - 1 - i ] ) );

  std::vector<double> f;
  f.push_back( 0.0 );
  f.push_back( 10.0 );
  f.push_back( 20.0 );
  f.push_back( 60.0 );
  f.push_back( 100.0 );

  std::vector<double> h = fir_t::response( fc , 250 , f );
  REQUIRE( h[0] < 0.02 );
  REQUIRE( h[1] == Approx( 1.0 ).margin( 0.02 ) );
  REQUIRE( h[2] == Approx( 1.0 ).margin( 0.02 ) );
  REQUIRE( h[3] < 0.02 );
  REQUIRE( h[4] < 0.02 );
}

TEST_CASE( "direct and FFT convolution agree" , "[fir]" )
{
  std::vector<double> fc = dsptools::design_bandpass_fir( 0.01 , 5 , 250 , 5 , 30 );
  fir_impl_t fir( fc );

  std::vector<double> x = testing::sines( 250 , 2000 , std::vector<double>( 1 , 7.0 ) , std::vector<double>( 1 , 1.0 ) );
  std::vector<double> y2 = testing::sines( 250 , 2000 , std::vector<double>( 1 , 70.0 ) , std::vector<double>( 1 , 0.5 ) );
  for (int i=0;i<x.size();i++) x[i] += y2[i];

  std::vector<double> a = fir.filter( &x );
  std::vector<double> b = fir.fft_filter( &x );
  
  REQUIRE( a.size() == x.size() );
  REQUIRE( b.size() == x.size() );
  for (int i=0;i<a.size();i++)
    REQUIRE( a[i] == Approx( b[i] ).margin( 1e-9 ) );
}

TEST_CASE( "even-length or asymmetric kernels are rejected" , "[fir]" )
{
  std::vector<double> even( 4 , 0.25 );
  REQUIRE_THROWS_AS( fir_impl_t( even ) , eegprep::eegprep_error );

  std::vector<double> skew( 3 , 0.0 );
  skew[0] = 1;
  REQUIRE_THROWS_AS( fir_impl_t( skew ) , eegprep::eegprep_error );
}

TEST_CASE( "band-pass removes line noise and high frequencies" , "[fir]" )
{
  const double sr = 2500;
  const int n = 10 * sr;

  std::vector<double> frq , amp;
  frq.push_back( 60 );   amp.push_back( 50e-6 );
  frq.push_back( 1000 ); amp.push_back( 50e-6 );

  eegprep::series_t s = testing::blank( std::vector<std::string>( 1 , "Cz" ) , sr , n );
  std::vector<double> x = testing::sines( sr , n , frq , amp );
  for (int i=0;i<n;i++) s.data(0,i) = x[i];

  eegprep::filter_spec_t spec( 1 , 40 );
  int ntaps = 0;
  eegprep::series_t f = dsptools::apply_fir( s , spec , &ntaps );
  
  REQUIRE( ntaps % 2 == 1 );
  REQUIRE( f.nsamples() == s.nsamples() );
  REQUIRE( f.labels == s.labels );

  const double before = MiscMath::rms( middle( s.row(0) ) );
  const double after = MiscMath::rms( middle( f.row(0) ) );
  REQUIRE( after < 0.05 * before );
}

TEST_CASE( "band-pass keeps in-band signal in phase" , "[fir]" )
{
  const double sr = 250;
  const int n = 20 * sr;
  
  eegprep::series_t s = testing::blank( std::vector<std::string>( 1 , "Cz" ) , sr , n );
  std::vector<double> x = testing::sines( sr , n , std::vector<double>( 1 , 10.0 ) , std::vector<double>( 1 , 30e-6 ) );
  for (int i=0;i<n;i++) s.data(0,i) = x[i];

  eegprep::series_t f = dsptools::apply_fir( s , eegprep::filter_spec_t( 1 , 40 ) );

  // zero phase: no lag, so the samples line up
  REQUIRE( Statistics::correlation( middle( s.row(0) ) , middle( f.row(0) ) ) > 0.99 );
  REQUIRE( MiscMath::rms( middle( f.row(0) ) ) == Approx( MiscMath::rms( middle( s.row(0) ) ) ).epsilon( 0.02 ) );
}

TEST_CASE( "band-pass above Nyquist fails" , "[fir]" )
{
  eegprep::series_t s = testing::blank( std::vector<std::string>( 1 , "Cz" ) , 60 , 600 );
  REQUIRE_THROWS_AS( dsptools::apply_fir( s , eegprep::filter_spec_t( 1 , 40 ) ) , eegprep::eegprep_error );
}

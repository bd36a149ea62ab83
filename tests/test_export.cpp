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

#include "eeg/export.h"
#include "eeg/reader.h"
#include "fiff/fiff.h"
#include "helper/errors.h"
#include "timeline/epochs.h"
#include "tests/test_support.h"

#include <fstream>

static eegprep::series_t ramp( double sr , double secs )
{
  std::vector<std::string> labels;
  labels.push_back( "Fz" );
  labels.push_back( "Cz" );
  labels.push_back( "Pz" );
  const int n = sr * secs;
  eegprep::series_t s = testing::blank( labels , sr , n );
  for (int c=0;c<3;c++)
    for (int i=0;i<n;i++)
      s.data(c,i) = ( c + 1 ) * 1e-6 * ( i % 7 );
  return s;
}

TEST_CASE( "epochs are fixed, non-overlapping windows from the start" , "[epochs]" )
{
  eegprep::series_t s = ramp( 100 , 10.5 );
  
  eegprep::epoched_t e = eegprep::make_epochs( s , 2.0 );
  
  REQUIRE( e.window == 200 );
  REQUIRE( e.nepochs() == 5 );
  REQUIRE( e.onsets[0] == 0 );
  REQUIRE( e.onsets[4] == 800 );
  REQUIRE( e.epochs[3].nsamples() == 200 );
  REQUIRE( e.epochs[3].data(2,0) == s.data(2,600) );
  REQUIRE( e.epochs[1].labels == s.labels );
}

TEST_CASE( "epoch windows round to whole samples" , "[epochs]" )
{
  REQUIRE( eegprep::epoch_samples( 2.0 , 256 ) == 512 );
  REQUIRE( eegprep::epoch_samples( 1.0 , 250.4 ) == 250 );
  REQUIRE( eegprep::epoch_samples( 0.001 , 100 ) == 0 );
}

TEST_CASE( "bad epoch lengths fail" , "[epochs]" )
{
  eegprep::series_t s = ramp( 100 , 3 );
  REQUIRE_THROWS_AS( eegprep::make_epochs( s , 0 ) , eegprep::eegprep_error );
  REQUIRE_THROWS_AS( eegprep::make_epochs( s , 0.001 ) , eegprep::eegprep_error );
  REQUIRE_THROWS_AS( eegprep::make_epochs( s , 5.0 ) , eegprep::eegprep_error );
}

TEST_CASE( "epoch mean averages sample-wise" , "[epochs]" )
{
  eegprep::series_t s = ramp( 100 , 4 );
  for (int i=0;i<200;i++) s.data(0,i) = 1.0;
  for (int i=200;i<400;i++) s.data(0,i) = 3.0;
  
  eegprep::series_t m = eegprep::make_epochs( s , 2.0 ).mean();
  REQUIRE( m.nchans() == 3 );
  REQUIRE( m.nsamples() == 200 );
  REQUIRE( m.data(0,17) == Approx( 2.0 ) );
}

TEST_CASE( "continuous export writes FIFF and a channel x sample matrix" , "[export]" )
{
  eegprep::series_t s = ramp( 100 , 10 );
  const std::string fif = testing::tmpfile( "cont-clean.fif" );
  const std::string csv = testing::tmpfile( "cont-clean.csv" );

  eegprep::continuous_t c;
  c.series = s;
  eegprep::export_summary_t r = eegprep::export_cleaned( c , fif , csv , 1 , 40 );

  REQUIRE_FALSE( r.epoched );
  REQUIRE( r.rows == 3 );
  REQUIRE( r.cols == 1000 );

  int rows , cols;
  testing::text_shape( csv , &rows , &cols );
  REQUIRE( rows == 3 );
  REQUIRE( cols == 1000 );

  eegprep::recording_t back = eegprep::read_recording( fif );
  REQUIRE( back.series.labels == s.labels );
  REQUIRE( back.series.nsamples() == 1000 );
  REQUIRE( back.series.sr == Approx( 100 ) );
  REQUIRE_FALSE( back.source.has_date );
}

TEST_CASE( "epoched export writes the epochs and their mean" , "[export]" )
{
  const double sr = 250;
  eegprep::series_t s = ramp( sr , 10 );
  const std::string fif = testing::tmpfile( "ep-clean.fif" );
  const std::string csv = testing::tmpfile( "ep-clean.csv" );

  eegprep::cleaned_t c = eegprep::make_epochs( s , 2.0 );
  eegprep::export_summary_t r = eegprep::export_cleaned( c , fif , csv );
  
  REQUIRE( r.epoched );
  REQUIRE( r.nepochs == 5 );

  int rows , cols;
  testing::text_shape( csv , &rows , &cols );
  REQUIRE( rows == s.nchans() );
  REQUIRE( cols == 2.0 * sr );

  std::vector<eegprep::series_t> epochs;
  eegprep::recording_source_t src;
  fiff::read( fif , &src , &epochs );
  REQUIRE( epochs.size() == 5 );
  REQUIRE( epochs[2].nsamples() == 500 );
  REQUIRE( epochs[2].data(1,3) == Approx( s.data(1,1003) ).margin( 1e-10 ) );
}

TEST_CASE( "text matrix keeps full precision" , "[export]" )
{
  eegprep::series_t s = testing::blank( std::vector<std::string>( 1 , "Cz" ) , 10 , 2 );
  s.data(0,0) = 1.2345678901234567e-5;
  s.data(0,1) = -3e-7;
  
  const std::string f = testing::tmpfile( "precise.csv" );
  eegprep::write_csv( s , f );

  std::ifstream I( f.c_str() );
  double a , b;
  char comma;
  I >> a >> comma >> b;
  REQUIRE( a == s.data(0,0) );
  REQUIRE( b == s.data(0,1) );
}

TEST_CASE( "unwritable outputs are I/O failures" , "[export]" )
{
  eegprep::continuous_t c;
  c.series = ramp( 100 , 1 );
  REQUIRE_THROWS_AS( eegprep::export_cleaned( c , "/no/such/dir/x.fif" , "/no/such/dir/x.csv" ) , eegprep::io_failure_error );
  REQUIRE_THROWS_AS( eegprep::write_csv( c.series , "/no/such/dir/x.csv" ) , eegprep::io_failure_error );
}

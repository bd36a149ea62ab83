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

#include "pipeline/pipeline.h"
#include "db/db.h"
#include "eeg/reader.h"
#include "helper/errors.h"
#include "helper/helper.h"
#include "tests/test_support.h"

#include <sstream>

static std::string blink_edf( const std::string & name , bool with_eog = true )
{
  const std::string f = testing::tmpfile( name );
  testing::write_edf( testing::blink_mixture( 250 , 30 , with_eog ) , f );
  return f;
}

TEST_CASE( "EDF in, cleaned FIFF and text out" , "[pipeline]" )
{
  const std::string in = blink_edf( "subj1.edf" );
  const std::string fif = testing::tmpfile( "subj1-clean.fif" );
  const std::string csv = testing::tmpfile( "subj1-clean.csv" );

  eegprep::preproc_result_t res = eegprep::preprocess( in , fif , csv );

  REQUIRE( res.source.format == eegprep::FORMAT_EDF );
  REQUIRE( res.raw.nchans() == 5 );
  REQUIRE( res.raw.nsamples() == 7500 );
  REQUIRE( res.ntaps % 2 == 1 );
  
  REQUIRE( res.ica.nc == 4 );
  REQUIRE( res.eog.status == eegprep::EOG_DETECTED );
  REQUIRE( res.excludes.size() >= 1 );
  for (std::set<int>::const_iterator ii = res.excludes.begin(); ii != res.excludes.end(); ++ii)
    {
      REQUIRE( *ii >= 0 );
      REQUIRE( *ii < res.ica.nc );
    }
  
  REQUIRE_FALSE( res.exported.epoched );
  REQUIRE( std::holds_alternative<eegprep::continuous_t>( res.cleaned ) );

  // reload: same channels, count and rate
  eegprep::recording_t back = eegprep::read_recording( fif );
  REQUIRE( back.series.labels == res.raw.labels );
  REQUIRE( back.series.nchans() == 5 );
  REQUIRE( back.series.nsamples() == 7500 );
  REQUIRE( back.series.sr == Approx( 250 ) );
  REQUIRE( back.series.types[4] == EOG );
  REQUIRE_FALSE( back.source.has_date );

  int rows , cols;
  testing::text_shape( csv , &rows , &cols );
  REQUIRE( rows == 5 );
  REQUIRE( cols == 7500 );
}

TEST_CASE( "epoched output holds whole windows" , "[pipeline]" )
{
  const std::string in = blink_edf( "subj2.edf" );
  const std::string fif = testing::tmpfile( "subj2-epo.fif" );
  const std::string csv = testing::tmpfile( "subj2-epo.csv" );

  eegprep::options_t opt;
  opt.epoch = true;
  opt.epoch_length = 2.0;
  
  eegprep::preproc_result_t res = eegprep::preprocess( in , fif , csv , opt );

  REQUIRE( res.exported.epoched );
  REQUIRE( res.exported.nepochs == 15 );
  REQUIRE( res.exported.rows == 5 );
  REQUIRE( res.exported.cols == 500 );

  int rows , cols;
  testing::text_shape( csv , &rows , &cols );
  REQUIRE( rows == 5 );
  REQUIRE( cols == 2.0 * 250 );

  eegprep::series_t joined = eegprep::cleaned_series( res.cleaned );
  REQUIRE( joined.nsamples() == 15 * 500 );
  REQUIRE( joined.labels == res.raw.labels );
}

TEST_CASE( "unsupported input writes nothing" , "[pipeline]" )
{
  const std::string fif = testing::tmpfile( "notes-clean.fif" );
  const std::string csv = testing::tmpfile( "notes-clean.csv" );
  
  REQUIRE_THROWS_AS( eegprep::preprocess( testing::tmpfile( "notes.txt" ) , fif , csv ) , eegprep::unsupported_format_error );
  REQUIRE_FALSE( Helper::fileExists( fif ) );
  REQUIRE_FALSE( Helper::fileExists( csv ) );
}

TEST_CASE( "without EOG nothing is removed" , "[pipeline]" )
{
  const std::string in = blink_edf( "noeog.edf" , false );
  
  eegprep::preproc_result_t res = eegprep::preprocess( in , 
						       testing::tmpfile( "noeog-clean.fif" ) , 
						       testing::tmpfile( "noeog-clean.csv" ) );

  REQUIRE( res.eog.status == eegprep::EOG_SKIPPED );
  REQUIRE( res.excludes.empty() );

  // reconstruction is then the filtered data
  const eegprep::series_t & c = std::get<eegprep::continuous_t>( res.cleaned ).series;
  REQUIRE( c.data == res.raw.data );
}

TEST_CASE( "short four-channel recording without a reference" , "[pipeline]" )
{
  // 4 channels, 250 Hz, 5 seconds
  eegprep::series_t s = testing::blink_mixture( 250 , 5 , false );
  REQUIRE( s.nchans() == 4 );
  REQUIRE( s.nsamples() == 1250 );

  const std::string in = testing::tmpfile( "short4.edf" );
  testing::write_edf( s , in );

  eegprep::preproc_result_t res = eegprep::preprocess( in , 
						       testing::tmpfile( "short4-clean.fif" ) , 
						       testing::tmpfile( "short4-clean.csv" ) );

  REQUIRE( res.ica.nc <= 4 );
  REQUIRE( res.eog.status == eegprep::EOG_SKIPPED );
  REQUIRE( res.excludes.empty() );
  REQUIRE( res.raw.nchans() == 4 );
  REQUIRE( res.raw.sr == Approx( 250 ) );
}

TEST_CASE( "channels can be named as EOG" , "[pipeline]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 30 , true );
  s.labels[4] = "X1";
  s.types[4] = EEG;
  const std::string in = testing::tmpfile( "renamed.edf" );
  testing::write_edf( s , in );

  eegprep::options_t opt;
  opt.eog_channels.push_back( "x1" );
  eegprep::preproc_result_t res = eegprep::preprocess( in , 
						       testing::tmpfile( "renamed-clean.fif" ) , 
						       testing::tmpfile( "renamed-clean.csv" ) , 
						       opt );

  REQUIRE( res.ica.labels.size() == 4 );
  REQUIRE( res.eog.status == eegprep::EOG_DETECTED );
  REQUIRE( res.eog.refs[0] == "X1" );
  REQUIRE_FALSE( res.excludes.empty() );
}

TEST_CASE( "per-stage results are reported" , "[pipeline][db]" )
{
  const std::string in = blink_edf( "subj3.edf" );

  std::stringstream ss;
  writer_t writer( ss );

  eegprep::preprocess( in , testing::tmpfile( "subj3-clean.fif" ) , testing::tmpfile( "subj3-clean.csv" ) , 
		       eegprep::options_t() , &writer );

  const std::string out = ss.str();
  REQUIRE( out.find( "subj3\tREAD\t.\tNS\t5" ) != std::string::npos );
  REQUIRE( out.find( "subj3\tICA\t.\tNC\t4" ) != std::string::npos );
  REQUIRE( out.find( "subj3\tEOG\t.\tSTATUS\tDETECTED" ) != std::string::npos );
  REQUIRE( out.find( "\tEXPORT\t.\tROWS\t5" ) != std::string::npos );
  REQUIRE( out.find( "\tEOG\tCH/EOG;IC/1\tR\t" ) != std::string::npos );
  REQUIRE( out.find( "\tFILTER\tF/1\tH\t" ) != std::string::npos );
  REQUIRE( out.find( "\tFILTER\tF/40\tH\t" ) != std::string::npos );
}

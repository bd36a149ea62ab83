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
#include "ica/ica-eog.h"
#include "ica/ica-apply.h"
#include "stats/statistics.h"
#include "tests/test_support.h"

#include <cmath>

TEST_CASE( "blink component is found and removed" , "[eog]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 30 , true );

  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );
  eegprep::eog_result_t eog = eegprep::detect_eog( s , m );

  REQUIRE( eog.status == eegprep::EOG_DETECTED );
  REQUIRE( eog.refs.size() == 1 );
  REQUIRE( eog.refs[0] == "EOG" );
  REQUIRE( eog.scores.size() == 1 );
  REQUIRE( eog.scores[0].size() == m.nc );
  REQUIRE( eog.z[0].size() == m.nc );
  
  std::set<int> ex = eog.excludes();
  REQUIRE( ex.size() >= 1 );
  REQUIRE( ex.size() < m.nc );
  REQUIRE( *ex.begin() >= 0 );
  REQUIRE( *ex.rbegin() < m.nc );

  // every flagged IC tracks the EOG
  for (int i=0;i<eog.indices.size();i++)
    REQUIRE( fabs( eog.scores[0][ eog.indices[i] ] ) >= 0.5 );
  
  eegprep::series_t clean = eegprep::apply_ica( s , m , ex );

  const double before = fabs( Statistics::correlation( s.row(0) , s.row(4) ) );
  const double after = fabs( Statistics::correlation( clean.row(0) , clean.row(4) ) );
  REQUIRE( before > 0.8 );
  REQUIRE( after < 0.3 );
}

TEST_CASE( "no EOG channel skips detection" , "[eog]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , false );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );
  
  eegprep::eog_result_t eog = eegprep::detect_eog( s , m );
  REQUIRE( eog.status == eegprep::EOG_SKIPPED );
  REQUIRE( eog.excludes().empty() );
  REQUIRE( eegprep::eog_status_label( eog.status ) == "SKIPPED" );
}

TEST_CASE( "flat EOG fails softly" , "[eog]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , true );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );

  s.data.row(4).setConstant( 5e-6 );
  
  eegprep::eog_result_t eog = eegprep::detect_eog( s , m );
  REQUIRE( eog.status == eegprep::EOG_FAILED );
  REQUIRE( eog.reason != "" );
  REQUIRE( eog.excludes().empty() );
}

TEST_CASE( "an impossible threshold flags nothing" , "[eog]" )
{
  eegprep::series_t s = testing::blink_mixture( 250 , 20 , true );
  eegprep::ica_model_t m = eegprep::fit_ica( s , eegprep::ica_options_t() );

  eegprep::eog_options_t opt;
  opt.r_th = 1.01;
  opt.z_th = 100;
  
  eegprep::eog_result_t eog = eegprep::detect_eog( s , m , opt );
  REQUIRE( eog.status == eegprep::EOG_DETECTED );
  REQUIRE( eog.excludes().empty() );
}

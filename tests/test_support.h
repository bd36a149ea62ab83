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

#ifndef __EEGPREP_TEST_SUPPORT_H__
#define __EEGPREP_TEST_SUPPORT_H__

#include <string>
#include <vector>

#include "eeg/series.h"

namespace testing {

  // a path in the build tree (removed first if present)
  std::string tmpfile( const std::string & name );

  // nchans x n of zeros, EEG unless the label maps to another type
  eegprep::series_t blank( const std::vector<std::string> & labels , double sr , int n );

  // sum of sinusoids (amplitudes in volts) at the given frequencies
  std::vector<double> sines( double sr , int n , const std::vector<double> & frq , const std::vector<double> & amp );

  // train of Gaussian 'blinks' (unit height, ~80 ms), roughly every
  // 2.5 seconds with a seeded jitter
  std::vector<double> blinks( double sr , int n , long unsigned seed = 11 );

  // four EEG channels (Fp1, Fp2, C3, C4) mixed from three rhythmic
  // sources plus a blink source that dominates Fp1; optionally a fifth
  // EOG channel that tracks the blinks
  eegprep::series_t blink_mixture( double sr , double secs , bool with_eog = true );

  // a plain EDF (16-bit, 1-second records where possible); voltage
  // channels stored in microvolts, labelled with vunit
  void write_edf( const eegprep::series_t & s , const std::string & filename ,
		  const std::string & vunit = "uV" , const std::string & startdate = "01.01.85" );

  // a well-formed two-signal EDF whose signals differ in sample rate
  void write_mixed_rate_edf( const std::string & filename );

  // keep the first nbytes of a file
  void truncate_file( const std::string & filename , long nbytes );

  // lines / comma-delimited fields of a text matrix
  void text_shape( const std::string & filename , int * rows , int * cols );
  
}

#endif

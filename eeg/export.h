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

#ifndef __EEGPREP_EXPORT_H__
#define __EEGPREP_EXPORT_H__

#include <string>

#include "eeg/series.h"

namespace eegprep {

  // shape of what was written
  struct export_summary_t
  {
    export_summary_t() : epoched( false ) , nepochs( 0 ) , rows( 0 ) , cols( 0 ) { } 
    bool epoched;
    int nepochs;
    // text matrix dimensions
    int rows;
    int cols;
  };

  // FIFF (raw or epochs) plus a channels x samples text matrix; for
  // epochs the text holds the mean across windows. The measurement
  // date is never written. hp/lp are recorded in the FIFF header.
  export_summary_t export_cleaned( const cleaned_t & c , 
				   const std::string & fif_file , 
				   const std::string & csv_file ,
				   double hp = 0 , double lp = 0 );

  // one row per channel, comma-delimited, full precision
  void write_csv( const series_t & s , const std::string & filename );

}

#endif

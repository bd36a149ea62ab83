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

#ifndef __EEGPREP_EPOCHS_H__
#define __EEGPREP_EPOCHS_H__

#include "eeg/series.h"

namespace eegprep {

  // fixed-length, non-overlapping windows from sample 0; any final
  // partial window is dropped
  epoched_t make_epochs( const series_t & s , const double epoch_length );

  // window length in samples: round( epoch_length * sr )
  int epoch_samples( const double epoch_length , const double sr );
  
}

#endif

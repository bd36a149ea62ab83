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

#ifndef __EEGPREP_ICA_APPLY_H__
#define __EEGPREP_ICA_APPLY_H__

#include <set>

#include "eeg/series.h"
#include "ica/ica.h"

namespace eegprep {

  // removes the back-projection of the excluded components from the
  // decomposed channels; all other channels are copied unchanged
  series_t apply_ica( const series_t & s , const ica_model_t & m , const std::set<int> & excludes );

}

#endif

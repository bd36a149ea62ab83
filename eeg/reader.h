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

#ifndef __EEGPREP_READER_H__
#define __EEGPREP_READER_H__

#include <string>

#include "eeg/series.h"

namespace eegprep {

  // file format from the (case-insensitive) extension: .edf or .fif;
  // anything else throws unsupported_format_error
  format_t detect_format( const std::string & path );

  struct recording_t
  {
    recording_source_t source;
    series_t series;
  };

  // load a whole recording into memory
  recording_t read_recording( const std::string & path );
  
}

#endif

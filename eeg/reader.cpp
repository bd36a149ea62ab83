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

#include "eeg/reader.h"

#include "edf/edf.h"
#include "fiff/fiff.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

extern logger_t logger;

eegprep::format_t eegprep::detect_format( const std::string & path )
{
  const std::string ext = Helper::file_extension( path );
  if ( ext == "edf" ) return FORMAT_EDF;
  if ( ext == "fif" ) return FORMAT_FIF;
  throw unsupported_format_error( "unsupported file format" 
				  + ( ext == "" ? std::string( "" ) : " (." + ext + ")" )
				  + ": " + path + ", expecting .edf or .fif" );
}

eegprep::recording_t eegprep::read_recording( const std::string & path )
{

  // before touching the file
  const format_t fmt = detect_format( path );

  if ( ! Helper::fileExists( path ) )
    throw io_failure_error( "could not open " + path );
  
  recording_t rec;

  if ( fmt == FORMAT_EDF )
    {
      edf_t edf;
      rec.series = edf.load( path , &rec.source );
    }
  else
    rec.series = fiff::read( path , &rec.source );

  rec.series.validate();

  std::vector<int> eog = rec.series.channels( EOG );
  std::vector<int> stim = rec.series.channels( STIM );
  
  logger << "  " << format_label( fmt ) << " recording: " << rec.series.nchans() << " channels, "
	 << rec.series.nsamples() << " samples, " << rec.series.duration() << " seconds";
  if ( eog.size() != 0 ) logger << ", " << eog.size() << " EOG";
  if ( stim.size() != 0 ) logger << ", " << stim.size() << " STIM";
  logger << "\n";
  
  return rec;
}

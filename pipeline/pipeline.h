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

#ifndef __EEGPREP_PIPELINE_H__
#define __EEGPREP_PIPELINE_H__

#include <string>
#include <set>
#include <vector>

#include "eeg/series.h"
#include "eeg/export.h"
#include "dsp/fir.h"
#include "ica/ica.h"
#include "ica/ica-eog.h"
#include "graphics/plots.h"

struct param_t;
class writer_t;

namespace eegprep {

  struct options_t
  {
    options_t() : epoch( false ) , epoch_length( 2.0 ) { } 

    // band-pass, default 1-40 Hz
    filter_spec_t filter;

    // default 15 components, seed 97, maxit 'auto'
    ica_options_t ica;

    eog_options_t eog;
    
    bool epoch;
    double epoch_length;

    // channels forced to the EOG role
    std::vector<std::string> eog_channels;
    
    // lwr, upr, tw, ripple, nc, seed, maxit, tol, epoch, epoch-len, eog, r-th, z-th
    void set( const param_t & param );

    // keys understood by set()
    static std::set<std::string> keys();
  };

  struct preproc_result_t
  {
    recording_source_t source;
    
    // the band-passed recording (the input to ICA)
    series_t raw;
    
    cleaned_t cleaned;
    
    ica_model_t ica;

    std::set<int> excludes;
    
    eog_result_t eog;

    export_summary_t exported;

    int ntaps;
  };

  // read, filter, ICA, EOG rejection, (epoch,) export; throws
  // unsupported_format_error for anything but .edf/.fif, before reading
  preproc_result_t preprocess( const std::string & input , 
			       const std::string & fif_file , 
			       const std::string & csv_file , 
			       const options_t & opt = options_t() ,
			       writer_t * writer = NULL );

  // the continuous series behind a cleaned result (for epochs, the
  // windows joined end to end)
  series_t cleaned_series( const cleaned_t & c );
  
}

#endif

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

#ifndef __EEGPREP_ICA_EOG_H__
#define __EEGPREP_ICA_EOG_H__

#include <vector>
#include <set>
#include <string>

#include "eeg/series.h"
#include "ica/ica.h"

namespace eegprep {

  enum eog_status_t
    {
      EOG_DETECTED ,
      EOG_SKIPPED ,   // no EOG channels
      EOG_FAILED      // scoring failed; nothing excluded
    };

  std::string eog_status_label( eog_status_t s );
  
  struct eog_options_t
  {
    eog_options_t() : r_th( 0.5 ) , z_th( 3.0 ) , passes( 2 ) , lwr( 1.0 ) , upr( 10.0 ) { }

    // |r| at or above this is always flagged
    double r_th;

    // adaptive z-score of |r| across components
    double z_th;
    int passes;

    // band applied to both sources and references before scoring
    double lwr;
    double upr;
  };
  
  struct eog_result_t
  {
    eog_result_t() : status( EOG_SKIPPED ) { } 
    
    eog_status_t status;

    // flagged components (0-based, sorted)
    std::vector<int> indices;

    // reference channel labels, and per reference x component scores
    std::vector<std::string> refs;
    std::vector<std::vector<double> > scores;
    std::vector<std::vector<double> > z;

    std::string reason;

    // empty unless DETECTED
    std::set<int> excludes() const;
  };

  // scores ICs against every EOG channel of s; never throws for
  // failures of the scoring itself
  eog_result_t detect_eog( const series_t & s , const ica_model_t & m , const eog_options_t & opt = eog_options_t() );

}

#endif

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

#ifndef __EEGPREP_SERIES_H__
#define __EEGPREP_SERIES_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <variant>
#include <ctime>

#include "defs/defs.h"

namespace eegprep {

  enum format_t
    {
      FORMAT_EDF ,
      FORMAT_FIF 
    };

  std::string format_label( format_t f );
  
  //
  // where a recording came from
  //
  
  struct recording_source_t
  {
    recording_source_t() : format( FORMAT_EDF ) , has_date( false ) , meas_date( 0 ) { } 

    std::string path;

    format_t format;

    // acquisition timestamp (UTC seconds); may be absent
    bool has_date;
    std::time_t meas_date;

    void clear_date() { has_date = false; meas_date = 0; } 
    
    void set_date( std::time_t t ) { has_date = true; meas_date = t; } 
  };

  
  //
  // multichannel series: channels x samples, one sample rate
  //
  
  struct series_t
  {

    series_t() : sr( 0 ) { } 

    std::vector<std::string> labels;

    std::vector<channel_type_t> types;

    // Hz
    double sr;

    // channels x samples; voltage channels held in volts
    Eigen::MatrixXd data;

    int nchans() const { return data.rows(); } 

    int nsamples() const { return data.cols(); } 

    double duration() const { return sr > 0 ? nsamples() / sr : 0 ; } 

    // slot of a channel (exact label), or -1
    int channel( const std::string & label ) const;

    // all slots of a given role
    std::vector<int> channels( channel_type_t t ) const;

    bool has( channel_type_t t ) const { return channels( t ).size() != 0 ; }

    std::vector<double> row( const int ch ) const;

    // contiguous sample range [start, start+n) of all channels
    series_t slice( const int start , const int n ) const;

    // halts if the invariants do not hold (unique labels, one role per
    // channel, positive rate, rows == channels)
    void validate() const;

    // force listed channels to a role (e.g. eog=Fp1,Fp2)
    void set_type( const std::vector<std::string> & chs , channel_type_t t );

  };


  //
  // result of cleaning: either the continuous series, or fixed-length
  // windows cut from it
  //
  
  struct continuous_t
  {
    series_t series;
  };

  struct epoched_t
  {
    epoched_t() : epoch_length( 0 ) , window( 0 ) { } 

    // seconds, and samples per window
    double epoch_length;
    int window;

    // sample offset of each window in the source series
    std::vector<int> onsets;

    // one series per window, each nchans x window
    std::vector<series_t> epochs;

    int nepochs() const { return epochs.size(); } 

    // sample-wise mean across windows (nchans x window)
    series_t mean() const;
  };

  typedef std::variant<continuous_t,epoched_t> cleaned_t;
  
}

#endif

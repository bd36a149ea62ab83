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

#ifndef __EEGPREP_EDF_H__
#define __EEGPREP_EDF_H__

#include <string>
#include <vector>
#include <cstdio>
#include <ctime>
#include <stdint.h>

#include "eeg/series.h"

typedef unsigned char byte_t;

struct edf_header_t
{
  
  edf_header_t() : nbytes_header(0), edfplus(false), continuous(true), nr(0), record_duration(0), ns_all(0) { } 

  // char[8]
  std::string    version;
  
  // char[80]
  std::string    patient_id;
  
  // char[80]
  std::string    recording_info;
  
  // dd.mm.yy    char[8]
  std::string    startdate;
  
  // hh.mm.ss    char[8]
  std::string    starttime;
  
  // char[8]
  int            nbytes_header;
  
  // char[44], EDF+C / EDF+D status
  std::string    reserved;  

  bool           edfplus;
  bool           continuous;
  
  // Number of records | char[8]
  int            nr;

  // Duration in seconds | char[8]
  double         record_duration;
  
  // Number of signals | char[4]
  int            ns_all;
  
  //
  // For each signal (including any annotation channels)
  //

  std::vector<std::string> label;
  std::vector<bool>        annotation_channel;
  std::vector<std::string> transducer_type;
  std::vector<std::string> phys_dimension;
  std::vector<double>      physical_min;
  std::vector<double>      physical_max; 
  std::vector<int>         digital_min;
  std::vector<int>         digital_max; 
  std::vector<std::string> prefiltering;
  std::vector<int>         n_samples;  
  std::vector<std::string> signal_reserved;

  // derived values
  std::vector<double>      bitvalue;
  std::vector<double>      offset;

  // bytes per record (all signals)
  long record_size() const;
  
  // parse the fixed header and per-signal headers
  void read( FILE * file , const std::string & filename );

  // start date/time as UTC seconds; false if not parseable
  bool start_time( std::time_t * t ) const;
  
};


struct edf_t
{

  std::string filename;

  edf_header_t header;

  // read header and all records into a series (data channels only)
  eegprep::series_t load( const std::string & filename , eegprep::recording_source_t * src );

  //
  // header-field helpers
  //
  
  static int get_int( byte_t ** p , int sz );
  static double get_double( byte_t ** p , int sz );
  static std::string get_string( byte_t ** p , int sz );

  // scale from a physical dimension label (e.g. uV) to volts; 1 if not a voltage 
  static double volts( const std::string & dim );
  
};

#endif

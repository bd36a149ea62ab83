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

#ifndef __EEGPREP_DEFS_H__
#define __EEGPREP_DEFS_H__

#include <map>
#include <set>
#include <string>
#include <complex>
#include <stdint.h>
#include <vector>

// channel roles; EOG channels are the reference-artifact channels
// used to score ICs, and are never themselves decomposed

enum channel_type_t
  {
    IGNORE ,  // drop these signals
    EOG ,
    ECG , 
    EMG , 
    STIM ,    // trigger / status lines
    MISC ,
    EEG       // any EEG
  };

// look-up table to guess channel type (or can be supplied)
typedef std::map<channel_type_t,std::set<std::string> > channel_map_t;

struct globals
{
  
  static std::string version;
  static std::string date;

  // return code (for the command-line tool)
  static int retcode;

  //
  // Channel types
  //

  static channel_map_t chmap1; // wildcard, case-insensitive matching 
  static channel_map_t chmap2; // exact matching (preferred over chmap1)
  static std::map<channel_type_t,std::string> ch2label; // names for types
  static void channel_type( const std::string & , channel_type_t );
  static channel_type_t map_channel( const std::string & s );
  static std::string map_channel_label( channel_type_t );
  static void add_channel_map( const std::string & s , channel_type_t ch );
  static void add_channel_map_exact( const std::string & s , channel_type_t ch );
  static void init_channel_types();

  // output common stratifier labels
  static std::string signal_strat;
  static std::string ic_strat;
  static std::string epoch_strat;
  static std::string freq_strat;

  // no logging at all
  static bool silent;

  // extra logging (e.g. ICA iteration trace)
  static bool verbose;
  
  // global functions: primary initiation of all globals
  void init_defs();
  
};

#endif

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

#include "defs.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <iostream>

logger_t logger( "+++ eegprep" );

std::string globals::version;
std::string globals::date;

int globals::retcode;

channel_map_t globals::chmap1; 
channel_map_t globals::chmap2; 
std::map<channel_type_t,std::string> globals::ch2label;

std::string globals::signal_strat;
std::string globals::ic_strat;
std::string globals::epoch_strat;
std::string globals::freq_strat;

bool globals::silent;
bool globals::verbose;


void globals::init_defs()
{

  version = "v0.4.2";
  
  date    = "19-Oct-2026";

  retcode = 0;

  silent = false;

  verbose = false;
  
  //
  // Channel types
  //

  init_channel_types();
  
  //
  // Common output stratifiers
  //

  signal_strat = "CH";
  ic_strat     = "IC";
  epoch_strat  = "E";
  freq_strat   = "F";

}


void globals::channel_type( const std::string & s , channel_type_t ch )
{
  ch2label[ ch ] = s;
}

std::string globals::map_channel_label( channel_type_t ch )
{
  std::map<channel_type_t,std::string>::const_iterator cc = ch2label.find( ch );
  if ( cc == ch2label.end() ) return "EEG";
  return cc->second;
}

channel_type_t globals::map_channel( const std::string & s )
{

  // for wildcards/case-insensitive matches
  const std::string s2 = Helper::toupper( s );
  
  // try for an exact match first
  channel_map_t::const_iterator cc = chmap2.begin();
  while ( cc != chmap2.end() )
    {
      if ( cc->second.find( s2 ) != cc->second.end() )
	return cc->first;
      ++cc;
    }

  // then wildcards, in order of type
  cc = chmap1.begin();
  while ( cc != chmap1.end() )
    {
      const std::set<std::string> & ss = cc->second;
      std::set<std::string>::const_iterator jj = ss.begin();
      while ( jj != ss.end() )
	{
 	  if ( s2.find( *jj ) != std::string::npos ) // any match?
	    return cc->first;
	  ++jj;
	}
      ++cc;
    }
    
  // otherwise, not found... assume EEG
  return EEG;
}

void globals::add_channel_map( const std::string & s , channel_type_t ch )
{
  chmap1[ ch ].insert( Helper::toupper( s ) );
}

void globals::add_channel_map_exact( const std::string & s , channel_type_t ch )
{
  chmap2[ ch ].insert( Helper::toupper( s ) );
}

void globals::init_channel_types()
{

  chmap1.clear();
  chmap2.clear();
  
  channel_type( "IGNORE" , IGNORE );
  channel_type( "EOG" , EOG );
  channel_type( "ECG" , ECG );
  channel_type( "EMG" , EMG );
  channel_type( "STIM" , STIM );
  channel_type( "MISC" , MISC );
  channel_type( "EEG" , EEG );
  
  // EOG
  add_channel_map( "EOG" , EOG );
  add_channel_map( "LOC" , EOG );
  add_channel_map( "ROC" , EOG );
  add_channel_map_exact( "E1" , EOG );
  add_channel_map_exact( "E2" , EOG );
  
  // ECG
  add_channel_map( "ECG" , ECG );
  add_channel_map( "EKG" , ECG );

  // EMG
  add_channel_map( "EMG" , EMG );
  add_channel_map( "CHIN" , EMG );

  // STIM
  add_channel_map( "STI" , STIM );
  add_channel_map( "STATUS" , STIM );
  add_channel_map( "TRIGGER" , STIM );

}

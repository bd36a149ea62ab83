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

#include "timeline/epochs.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;

int eegprep::epoch_samples( const double epoch_length , const double sr )
{
  return (int)floor( epoch_length * sr + 0.5 );
}

eegprep::epoched_t eegprep::make_epochs( const series_t & s , const double epoch_length )
{

  if ( ! ( epoch_length > 0 ) ) 
    Helper::halt( "epoch length must be positive" );

  epoched_t r;
  r.epoch_length = epoch_length;
  r.window = epoch_samples( epoch_length , s.sr );

  if ( r.window < 1 ) 
    Helper::halt( "epoch length " + Helper::dbl2str( epoch_length ) + " s is shorter than one sample" );
  
  const int total = s.nsamples();
  
  int start = 0;
  
  while ( 1 ) 
    {
      // skip any final epoch that does not fit
      if ( start + r.window > total ) break;

      r.onsets.push_back( start );
      r.epochs.push_back( s.slice( start , r.window ) );
      
      start += r.window;
    }
  
  if ( r.epochs.size() == 0 ) 
    Helper::halt( "recording (" + Helper::dbl2str( s.duration() ) + " s) is shorter than one " 
		  + Helper::dbl2str( epoch_length ) + " s epoch" );
  
  logger << "  " << r.nepochs() << " epochs of " << epoch_length << " s (" << r.window << " samples)";
  if ( start < total ) logger << ", dropping " << total - start << " trailing samples";
  logger << "\n";
  
  return r;
}

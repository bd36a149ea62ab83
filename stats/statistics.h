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

#ifndef __EEGPREP_STATISTICS_H__
#define __EEGPREP_STATISTICS_H__

#include <vector>
#include <cstddef>

namespace Statistics { 

  // inverse of the standard normal CDF
  double ltqnorm( double p );
  
  // Pearson correlation; returns false if either vector is invariant
  // or the lengths differ
  bool correlation( const std::vector<double> & a , const std::vector<double> & b , double * r );
  
  double correlation( const std::vector<double> & a , const std::vector<double> & b );

  // z-scores of x, optionally excluding some elements from the mean/SD
  std::vector<double> zscores( const std::vector<double> & x , const std::vector<bool> * exclude = NULL );
  
}

#endif

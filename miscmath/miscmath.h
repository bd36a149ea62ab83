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

#ifndef __EEGPREP_MISCMATH_H__
#define __EEGPREP_MISCMATH_H__

#include <vector>

namespace MiscMath
{

  // smallest power of 2 >= a
  long int nextpow2( const long int a );
  
  double mean( const std::vector<double> & x );
  
  double sdev( const std::vector<double> & x );
  double sdev( const std::vector<double> & x , double m );

  double rms( const std::vector<double> & x );
  
}

#endif

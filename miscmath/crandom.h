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

#ifndef __EEGPREP_CRANDOM_H__
#define __EEGPREP_CRANDOM_H__

#include <vector>

// Park-Miller minimal standard generator with a Bays-Durham shuffle;
// one instance per consumer, so that seeded runs are reproducible

class CRandom 
{
 public:
  
  static const int IA;
  static const int IM;
  static const int IQ;
  static const int IR;
  static const int NTAB;
  static const int NDIV;
  
  static const double EPS;
  static const double AM;
  static const double RNMX;

  explicit CRandom( long unsigned iseed = 1 ) { srand( iseed ); } 
  
  void srand( long unsigned iseed );

  // uniform on (0,1)
  double rand();

  // standard normal deviate (inverse CDF)
  double rnorm();
  
 private:

  int idum;
  int iy;
  std::vector<int> iv; 
  
};

#endif

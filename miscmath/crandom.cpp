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

#include "miscmath/crandom.h"
#include "stats/statistics.h"

const int CRandom::IA=16807;
const int CRandom::IM=2147483647;
const int CRandom::IQ=127773;
const int CRandom::IR=2836;
const int CRandom::NTAB=32;
const int CRandom::NDIV=(1+(IM-1)/NTAB);

const double CRandom::EPS=3.0e-16;
const double CRandom::AM=1.0/IM;
const double CRandom::RNMX=(1.0-EPS);


void CRandom::srand ( long unsigned i )
{

  // seed must be positive (and within range)
  idum = (int)( i % (long unsigned)IM );
  if ( idum < 1 ) idum = 1;
  
  iv.resize(NTAB);

  // load the shuffle table after 8 warm-ups
  for (int j=NTAB+7;j>=0;j--) {
    int k=idum/IQ;
    idum=IA*(idum-k*IQ)-IR*k;
    if (idum < 0) idum += IM;
    if (j < NTAB) iv[j] = idum;
  }
  iy=iv[0];
    
}

double CRandom::rand ()
{
  int k=idum/IQ;
  idum=IA*(idum-k*IQ)-IR*k;
  if (idum < 0) idum += IM;
  int j=iy/NDIV;
  iy=iv[j];
  iv[j] = idum;
  double temp = AM*iy;
  return temp > RNMX ? RNMX : temp;
}

double CRandom::rnorm()
{
  return Statistics::ltqnorm( rand() );
}

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

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

long int MiscMath::nextpow2( const long int a )
{
  // up to 2^40
  long int t = 1;
  for (int i=0;i<40;i++)
    {
      if ( a <= t ) return t;
      t *= 2;
    }
  Helper::halt( "value too large in nextpow2()" );
  return 0;
}

double MiscMath::mean( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return 0;
  double s = 0;
  for (int i=0;i<x.size();i++) s += x[i];
  return s / (double)x.size();
}

double MiscMath::sdev( const std::vector<double> & x )
{
  return sdev( x , mean( x ) );
}

double MiscMath::sdev( const std::vector<double> & x , double m )
{
  const int n = x.size();
  if ( n < 2 ) return 0;
  double ss = 0;
  for (int i=0;i<n;i++) ss += ( x[i] - m ) * ( x[i] - m );
  return sqrt( ss / (double)( n - 1 ) );
}

double MiscMath::rms( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return 0;
  double ss = 0;
  for (int i=0;i<x.size();i++) ss += x[i] * x[i];
  return sqrt( ss / (double)x.size() );
}


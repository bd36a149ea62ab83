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

#include "stats/statistics.h"
#include "helper/helper.h"

#include <cmath>

/*
 * Lower tail quantile for standard normal distribution function.
 *
 * This function returns an approximation of the inverse cumulative
 * standard normal distribution function.  I.e., given P, it returns
 * an approximation to the X satisfying P = Pr{Z <= X} where Z is a
 * random variable from the standard normal distribution.
 *
 * The algorithm uses a minimax approximation by rational functions
 * and the result has a relative error whose absolute value is less
 * than 1.15e-9.
 *
 * Author:      Peter J. Acklam
 */

static const double a[] =
  {
    -3.969683028665376e+01,
    2.209460984245205e+02,
    -2.759285104469687e+02,
    1.383577518672690e+02,
    -3.066479806614716e+01,
     2.506628277459239e+00
  };

static const double b[] =
  {
    -5.447609879822406e+01,
    1.615858368580409e+02,
    -1.556989798598866e+02,
    6.680131188771972e+01,
    -1.328068155288572e+01
  };

static const double c[] =
  {
    -7.784894002430293e-03,
    -3.223964580411365e-01,
    -2.400758277161838e+00,
    -2.549732539343734e+00,
    4.374664141464968e+00,
     2.938163982698783e+00
  };

static const double d[] =
  {
    7.784695709041462e-03,
    3.224671290700398e-01,
    2.445134137142996e+00,
    3.754408661907416e+00
  };

#define LOW 0.02425
#define HIGH 0.97575

double Statistics::ltqnorm( double p )
{
  
  double q, r;
  
  if (p < 0 || p > 1)
    return 0.0;
  else if (p == 0)
    return -HUGE_VAL;
  else if (p == 1)
    return HUGE_VAL;
  else if (p < LOW)
    {
      q = sqrt(-2*log(p));
      return (((((c[0]*q+c[1])*q+c[2])*q+c[3])*q+c[4])*q+c[5]) /
        ((((d[0]*q+d[1])*q+d[2])*q+d[3])*q+1);
    }
  else if (p > HIGH)
    {
      q  = sqrt(-2*log(1-p));
      return -(((((c[0]*q+c[1])*q+c[2])*q+c[3])*q+c[4])*q+c[5]) /
        ((((d[0]*q+d[1])*q+d[2])*q+d[3])*q+1);
    }
  else
    {
      q = p - 0.5;
      r = q*q;
      return (((((a[0]*r+a[1])*r+a[2])*r+a[3])*r+a[4])*r+a[5])*q /
        (((((b[0]*r+b[1])*r+b[2])*r+b[3])*r+b[4])*r+1);
    }
}


bool Statistics::correlation( const std::vector<double> & x , const std::vector<double> & y , double * r )
{
  
  const int n = x.size();
  if ( y.size() != n || n < 2 ) return false;
  
  double mx = 0 , my = 0;
  for (int i=0;i<n;i++) { mx += x[i]; my += y[i]; }
  mx /= (double)n;
  my /= (double)n;
  
  double sxy = 0 , sxx = 0 , syy = 0;
  for (int i=0;i<n;i++)
    {
      const double dx = x[i] - mx;
      const double dy = y[i] - my;
      sxy += dx * dy;
      sxx += dx * dx;
      syy += dy * dy;
    }
  
  if ( sxx <= 0 || syy <= 0 ) return false;
  
  *r = sxy / sqrt( sxx * syy );
  return Helper::realnum( *r );
}

double Statistics::correlation( const std::vector<double> & x , const std::vector<double> & y )
{
  double r = 0;
  if ( ! correlation( x , y , &r ) ) 
    Helper::halt( "could not calculate correlation (invariant or unequal-length inputs)" );
  return r;
}

std::vector<double> Statistics::zscores( const std::vector<double> & x , const std::vector<bool> * exclude )
{
  const int n = x.size();

  double s = 0 , ss = 0;
  int m = 0;
  for (int i=0;i<n;i++)
    {
      if ( exclude != NULL && (*exclude)[i] ) continue;
      s += x[i];
      ss += x[i] * x[i];
      ++m;
    }

  std::vector<double> z( n , 0 );
  if ( m == 0 ) return z;
  
  // population SD
  const double mean = s / (double)m;
  const double var = ss / (double)m - mean * mean;
  const double sd = var > 0 ? sqrt( var ) : 0 ;
  if ( sd == 0 ) return z;
  
  for (int i=0;i<n;i++) z[i] = ( x[i] - mean ) / sd;
  return z;
}

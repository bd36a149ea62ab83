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

#ifndef __EEGPREP_FFTWRAP_H__
#define __EEGPREP_FFTWRAP_H__

#include <fftw3.h>

#include <vector>
#include <cmath>
#include <complex>

//
// Real 1D DFT
//

class real_FFT
{
  
 public:
  
  real_FFT() : in(NULL), out(NULL), p(NULL) { } 

  // Ndata values, zero-padded to Nfft
  real_FFT( int Ndata , int Nfft ) 
    : in(NULL), out(NULL), p(NULL)
    {
      init( Ndata , Nfft );
    }
  
  void init( int Ndata , int Nfft );

  void reset() ;
  
  ~real_FFT();
  
 private:

  // FFTW buffers and plan are owned
  real_FFT( const real_FFT & );
  real_FFT & operator=( const real_FFT & );
  
  // Size of data 
  int Ndata;
  
  double * in;

  fftw_complex *out;
  
  fftw_plan p;
  
  // Size (NFFT)
  int Nfft;
  
 public:
  
  int cutoff;

  // |X(k)| for k < cutoff
  std::vector<double> mag;
  
 public:
  
  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );
    
  // positive-frequency half of the raw transform (cutoff values)
  std::vector<std::complex<double> > transform() const;

};


//
// 1D C->R inverse DFT
//

class real_iFFT
{
  
 public:
  
  real_iFFT() : in(NULL), out(NULL), p(NULL) { } 

  explicit real_iFFT( int Nfft ) 
    : in(NULL), out(NULL), p(NULL)
  {
    init( Nfft );
  }
  
  void init( int Nfft );
  
  void reset();
  
  ~real_iFFT();

 private:

  real_iFFT( const real_iFFT & );
  real_iFFT & operator=( const real_iFFT & );
  
  // half-complex input (Nfft/2+1 values)
  fftw_complex * in;

  double * out;

  fftw_plan p;
  
  int Nfft;

  int cutoff;
  
 public:

  bool apply( const std::vector<std::complex<double> > & x );

  // real values scaled by 1/Nfft
  std::vector<double> inverse() const;
  
};

#endif

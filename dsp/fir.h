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

#ifndef __EEGPREP_DSP_FIR_H__
#define __EEGPREP_DSP_FIR_H__

#include <vector>
#include <cstdio>
#include <cmath>
#include <cstdlib>
#include <complex>
#include <string>

#include "eeg/series.h"

//
// band-pass filter settings
//

namespace eegprep {

  struct filter_spec_t
  {

    filter_spec_t( double lwr_ = 1.0 , double upr_ = 40.0 )
    : lwr( lwr_ ) , upr( upr_ ) , ripple( 0.01 ) , tw( -1 ) { } 
    
    // Hz, 0 < lwr < upr < Nyquist
    double lwr;
    double upr;

    // Kaiser pass/stop-band ripple (0.01 = 40 dB)
    double ripple;

    // transition width (Hz); <= 0 means the default
    double tw;
    
    // min( max( 0.25 * lwr , 2 ) , lwr ) unless set
    double transition() const;

    // halts on bad cutoffs for this sample rate
    void validate( double sr ) const;

    std::string label() const;
    
  };

}


// FIR design by windowing (Kaiser); see "FIR filters by Windowing",
// A. Greensted, http://www.labbookpages.co.uk/audio/firWindowing.html

struct fir_t
{

  std::vector<double> create2TransSinc( int windowLength, double trans1Freq, double trans2Freq, double sampFreq );

  void calculateKaiserParams(double ripple, double transWidth, double sampFreq, int *windowLength, double *beta);

  std::vector<double> createKaiserWindow( const std::vector<double> *in, double beta);

  double modZeroBessel(double x);

  // magnitude response at the given frequencies (zero-padded DFT of the taps)
  static std::vector<double> response( const std::vector<double> & coefs , double sampFreq , const std::vector<double> & frqs );
  
};


// applies a linear-phase (odd, symmetric) FIR with its group delay
// removed, i.e. zero-phase; input is zero-padded at both edges

struct fir_impl_t { 
  
  fir_impl_t( const std::vector<double> & coefs_ ); 

  int length;
  std::vector<double> coefs;

  // direct (time-domain) convolution
  std::vector<double> filter( const std::vector<double> * x ) const;

  // FFT convolution; same result as filter()
  std::vector<double> fft_filter( const std::vector<double> * x );

private:

  // cached transform of the taps, for the last Nfft used
  long int Nfft;
  std::vector<std::complex<double> > H;
  
};


namespace dsptools 
{ 
  
  std::vector<double> design_bandpass_fir( double ripple , double tw , double fs , double f1 , double f2 );

  // all channels of a series; returns a new series (ntaps set if non-null)
  eegprep::series_t apply_fir( const eegprep::series_t & s , const eegprep::filter_spec_t & spec , int * ntaps = NULL );
  
}

#endif

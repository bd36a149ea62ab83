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

#include "dsp/fir.h"

#include "fftw/fftwrap.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


//
// filter_spec_t
//

double eegprep::filter_spec_t::transition() const
{
  if ( tw > 0 ) return tw;
  double t = 0.25 * lwr;
  if ( t < 2.0 ) t = 2.0;
  if ( t > lwr ) t = lwr;
  return t;
}

void eegprep::filter_spec_t::validate( double sr ) const
{
  if ( ! ( lwr > 0 ) ) 
    Helper::halt( "lower cutoff must be positive: " + Helper::dbl2str( lwr ) );
  if ( ! ( upr > lwr ) ) 
    Helper::halt( "upper cutoff (" + Helper::dbl2str( upr ) + ") must exceed lower cutoff (" + Helper::dbl2str( lwr ) + ")" );
  if ( upr >= sr / 2.0 ) 
    Helper::halt( "upper cutoff " + Helper::dbl2str( upr ) + " Hz is not below Nyquist (" + Helper::dbl2str( sr / 2.0 ) + " Hz)" );
  if ( ! ( ripple > 0 && ripple < 1 ) )
    Helper::halt( "ripple must be between 0 and 1" );
}

std::string eegprep::filter_spec_t::label() const
{
  return Helper::dbl2str( lwr ) + "-" + Helper::dbl2str( upr ) + " Hz";
}


//
// fir_impl_t
//

fir_impl_t::fir_impl_t( const std::vector<double> & coefs_ ) : Nfft( 0 )
{
  length = coefs_.size();
  coefs = coefs_;

  // expecting a linear-phase FIR with odd number of coefficients
  if ( coefs.size() % 2 != 1 ) Helper::halt( "expecting odd number of taps in FIR" );
  int del = ( coefs.size() - 1 ) / 2 ;
  
  double checksum = 0;
  for (int i=0;i<del;i++)
    checksum += fabs( coefs[i] - coefs[ coefs.size() - 1 - i ] );
  if ( checksum > 1e-8 ) Helper::halt( "FIR taps are not symmetric" );
}


std::vector<double> fir_impl_t::filter( const std::vector<double> * x ) const
{
  
  const int n = x->size();
  const int delay_idx = (length-1)/2;
  std::vector<double> r( n , 0 ) ;
  
  // output i is centred on input i; zeros beyond either edge
  for (int i=0;i<n;i++)
    {
      double sum = 0;
      for (int k=0;k<length;k++)
	{
	  const int j = i + delay_idx - k;
	  if ( j < 0 || j >= n ) continue;
	  sum += coefs[k] * (*x)[j];
	}
      r[i] = sum;
    }
  
  return r;
}


std::vector<double> fir_impl_t::fft_filter( const std::vector<double> * px )
{
  
  // signal length
  const int M = px->size();
  if ( M == 0 ) return std::vector<double>();
  
  // filter length
  const int L = length;
  
  // next power of 2 greater than M+L-1
  const long int N = MiscMath::nextpow2( M + L - 1 );

  // transform the taps once per size
  if ( N != Nfft )
    {
      Nfft = N;
      real_FFT ffth( L , Nfft );
      if ( ! ffth.apply( coefs ) ) Helper::halt( "internal error in FIR transform" );
      H = ffth.transform();
    }

  real_FFT fftx( M , Nfft );
  if ( ! fftx.apply( *px ) ) Helper::halt( "internal error in FIR transform" );
  std::vector<std::complex<double> > Y = fftx.transform();
  
  // convolution in the frequency domain
  for (int i=0;i<Y.size();i++) Y[i] *= H[i];

  real_iFFT ifft( Nfft );
  if ( ! ifft.apply( Y ) ) Helper::halt( "internal error in FIR inverse transform" );
  std::vector<double> conv_tmp = ifft.inverse();
  
  // trim, removing the group delay
  std::vector<double> conv( M );
  const int delay_idx = (length-1)/2;
  for (int i=0;i<M;i++)
    conv[i] = conv_tmp[ delay_idx + i ];

  return conv;
  
}


//
// design
//

std::vector<double> dsptools::design_bandpass_fir( double ripple , double tw , double fs , double f1 , double f2 )
{
  fir_t fir;
  int kaiserWindowLength;
  double beta;
  fir.calculateKaiserParams( ripple , tw , fs , &kaiserWindowLength, &beta);
  if ( kaiserWindowLength % 2 == 0 ) ++kaiserWindowLength;
  std::vector<double> fc = fir.create2TransSinc( kaiserWindowLength, f1 , f2, fs );
  return fir.createKaiserWindow(&fc, beta);
}


//
// apply
//

eegprep::series_t dsptools::apply_fir( const eegprep::series_t & s , const eegprep::filter_spec_t & spec , int * ntaps )
{

  spec.validate( s.sr );

  const double tw = spec.transition();
  
  std::vector<double> fc = design_bandpass_fir( spec.ripple , tw , s.sr , spec.lwr , spec.upr );

  if ( ntaps != NULL ) *ntaps = fc.size();

  if ( ! globals::silent && globals::verbose )
    logger << "  bandpass FIR " << spec.label() << ", TW = " << tw << " Hz, ripple = " << spec.ripple 
	   << ", " << fc.size() << " taps\n";
  
  fir_impl_t fir_impl( fc );

  // copy labels/types/rate; data replaced row by row
  eegprep::series_t r = s;

  for (int c=0;c<s.nchans();c++)
    {
      std::vector<double> x = s.row( c );
      std::vector<double> y = fir_impl.fft_filter( &x );
      for (int i=0;i<y.size();i++) r.data(c,i) = y[i];
    }
  
  return r;
}


//
// fir_t
//

// Create two sinc functions for filter with 2 transitions - Band pass
std::vector<double> fir_t::create2TransSinc(int windowLength, double trans1Freq, double trans2Freq, double sampFreq)
{

  std::vector<double> window( windowLength );
  
  double ft1 = trans1Freq / sampFreq;
  double ft2 = trans2Freq / sampFreq;
  
  double m_2 = 0.5 * (windowLength-1);
  int halfLength = windowLength / 2;
  
  // centre tap (avoids a divide by zero)
  if (2*halfLength != windowLength) 
    window[halfLength] = 2.0 * (ft2 - ft1);
  else 
    Helper::halt("create2TransSinc: for band pass filters, window length must be odd");
  
  for (int n=0 ; n<halfLength ; n++) {
    double val1 = sin(2.0 * M_PI * ft1 * (n-m_2)) / (M_PI * (n-m_2));
    double val2 = sin(2.0 * M_PI * ft2 * (n-m_2)) / (M_PI * (n-m_2));
    window[n] = val2 - val1;
    window[windowLength-n-1] = val2 - val1;
  }
  
  return window;
}

// Transition Width (transWidth) is given in Hz
// Sampling Frequency (sampFreq) is given in Hz
// Window Length (windowLength) will be set
void fir_t::calculateKaiserParams(double ripple, double transWidth, double sampFreq, int *windowLength, double *beta)
{
  if ( ! ( transWidth > 0 ) ) Helper::halt( "FIR transition width must be positive" );
  
  double dw = 2 * M_PI * transWidth / sampFreq;
  
  // ripple dB
  double a = -20.0 * log10(ripple);
  
  // filter order
  int m;
  if (a>21) m = ceil((a-7.95) / (2.285*dw));
  else m = ceil(5.79/dw);
  
  *windowLength = m + 1;
  
  if (a<=21) *beta = 0.0;
  else if (a<=50) *beta = 0.5842 * pow(a-21, 0.4) + 0.07886 * (a-21);
  else *beta = 0.1102 * (a-8.7);
}

std::vector<double> fir_t::createKaiserWindow( const std::vector<double> * in, double beta )
{

  const int windowLength = in->size();
  std::vector<double> out( windowLength );
  
  double m_2 = (double)(windowLength-1) / 2.0;
  double denom = modZeroBessel(beta);
    
  for (int n=0 ; n<windowLength ; n++)
    {
      double val = ((n) - m_2) / m_2;
      val = 1 - (val * val);
      out[n] = modZeroBessel(beta * sqrt(val)) / denom;
    }
  
  for (int n=0 ; n<windowLength ; n++) 
    out[n] *= (*in)[n];
  
  return out;
}

double fir_t::modZeroBessel(double x)
{
  double x_2 = x/2;
  double num = 1;
  double fact = 1;
  double result = 1;
  for (int i=1 ; i<20 ; i++) {
    num *= x_2 * x_2;
    fact *= i;
    result += num / (fact * fact);  
  }  
  return result;
}

std::vector<double> fir_t::response( const std::vector<double> & coefs , double sampFreq , const std::vector<double> & frqs )
{
  const int windowLength = coefs.size();

  // zero-pad short filters for resolution
  int fftSize = MiscMath::nextpow2( windowLength < 8192 ? 8192 : windowLength );

  real_FFT fft( windowLength , fftSize );
  if ( ! fft.apply( coefs ) ) Helper::halt( "internal error in FIR response" );

  // nearest bin
  std::vector<double> r( frqs.size() );
  for (int i=0;i<frqs.size();i++)
    {
      int bin = (int)floor( frqs[i] * fftSize / sampFreq + 0.5 );
      if ( bin < 0 ) bin = 0;
      if ( bin >= fft.cutoff ) bin = fft.cutoff - 1;
      r[i] = fft.mag[ bin ];
    }
  return r;
}

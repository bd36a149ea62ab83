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

#include "fftw/fftwrap.h"

#include "helper/helper.h"

//
// Real 1D DFT
//

void real_FFT::reset() 
{
  if ( p != NULL ) fftw_destroy_plan(p);
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = NULL;
  out = NULL;
}

real_FFT::~real_FFT() 
{    
  reset();
}


void real_FFT::init( int Ndata_, int Nfft_ )
{

  reset();
  
  Ndata = Ndata_;
  Nfft = Nfft_;

  if ( Ndata > Nfft ) Helper::halt( "Ndata cannot be larger than Nfft" );
  if ( Nfft < 1 ) Helper::halt( "Nfft must be positive" );
  
  in = (double*) fftw_malloc(sizeof(double) * Nfft);
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );

  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;

  // r2c only fills Nfft/2+1 outputs
  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * ( Nfft/2 + 1 ) );
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );

  for (int i=0;i<Nfft;i++) in[i] = 0;
  
  p = fftw_plan_dft_r2c_1d( Nfft, in, out , FFTW_ESTIMATE ) ;
  
  mag.assign(cutoff,0);
    
} 

bool real_FFT::apply( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return false;
  return apply( &(x[0]) , x.size() );
}
  

bool real_FFT::apply( const double * x , const int n )
{

  if ( n < Ndata ) return false;
  
  for (int i=0;i<Ndata;i++) in[i] = x[i];  

  // zero-padding
  for (int i=Ndata;i<Nfft;i++) in[i] = 0;  
  
  fftw_execute(p);

  for (int i=0;i<cutoff;i++)
    {      
      double a = out[i][0];
      double b = out[i][1];
      mag[i] = sqrt( a*a + b*b );
    }
  
  return true;

}


std::vector<std::complex<double> > real_FFT::transform() const
{
  const int nc = Nfft/2 + 1;
  std::vector<std::complex<double> > r( nc );
  for (int i=0;i<nc;i++) 
    r[i] = std::complex<double>( out[i][0] , out[i][1] );
  return r;
}


//
// C->R inverse
//

void real_iFFT::reset() 
{
  if ( p != NULL ) fftw_destroy_plan(p);
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = NULL;
  out = NULL;
}

real_iFFT::~real_iFFT() 
{    
  reset();
}

void real_iFFT::init( int Nfft_ )
{

  reset();
  
  Nfft = Nfft_;
  if ( Nfft < 1 ) Helper::halt( "Nfft must be positive" );

  cutoff = Nfft/2 + 1;
  
  in = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * cutoff );
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );

  out = (double*) fftw_malloc(sizeof(double) * Nfft);
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );
  
  for (int i=0;i<cutoff;i++) { in[i][0] = in[i][1] = 0; }
  
  // nb. c2r plans overwrite their input
  p = fftw_plan_dft_c2r_1d( Nfft, in, out , FFTW_ESTIMATE );
  
} 


bool real_iFFT::apply( const std::vector<std::complex<double> > & x )
{

  if ( x.size() < cutoff ) return false;
  
  for (int i=0;i<cutoff;i++)
    {
      in[i][0] = std::real( x[i] );
      in[i][1] = std::imag( x[i] );	
    }    

  fftw_execute(p);

  return true;
}


std::vector<double> real_iFFT::inverse() const
{
  std::vector<double> r(Nfft);
  for (int i=0;i<Nfft;i++) r[i] = out[i] / (double)Nfft;
  return r;
}



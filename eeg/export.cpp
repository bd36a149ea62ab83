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

#include "eeg/export.h"

#include "fiff/fiff.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <fstream>
#include <iomanip>
#include <variant>

extern logger_t logger;


void eegprep::write_csv( const series_t & s , const std::string & filename )
{

  std::ofstream O1( filename.c_str() , std::ios::out );

  if ( ! O1.good() ) 
    throw io_failure_error( "could not open " + filename + " for writing" );

  O1 << std::scientific << std::setprecision( 18 );
  
  for (int c=0;c<s.nchans();c++)
    {
      for (int i=0;i<s.nsamples();i++)
	O1 << ( i ? "," : "" ) << s.data(c,i);
      O1 << "\n";
    }

  O1.close();

  if ( O1.fail() ) 
    throw io_failure_error( "problem writing " + filename );
  
  logger << "  wrote " << s.nchans() << " x " << s.nsamples() << " matrix to " << filename << "\n";
}


namespace {

  struct exporter_t
  {
    exporter_t( const std::string & fif , const std::string & csv , double hp , double lp )
    : fif( fif ) , csv( csv ) , hp( hp ) , lp( lp ) { } 

    const std::string & fif;
    const std::string & csv;
    double hp , lp;
    
    eegprep::export_summary_t operator()( const eegprep::continuous_t & c ) const
    {
      eegprep::export_summary_t r;
      fiff::write_raw( c.series , fif , NULL , hp , lp );
      eegprep::write_csv( c.series , csv );
      r.rows = c.series.nchans();
      r.cols = c.series.nsamples();
      return r;
    }

    eegprep::export_summary_t operator()( const eegprep::epoched_t & e ) const
    {
      eegprep::export_summary_t r;
      r.epoched = true;
      r.nepochs = e.nepochs();
      fiff::write_epochs( e , fif , NULL , hp , lp );
      eegprep::series_t m = e.mean();
      eegprep::write_csv( m , csv );
      r.rows = m.nchans();
      r.cols = m.nsamples();
      return r;
    }
  };
  
}

eegprep::export_summary_t eegprep::export_cleaned( const cleaned_t & c , 
						   const std::string & fif_file , 
						   const std::string & csv_file ,
						   double hp , double lp )
{
  if ( fif_file == "" || csv_file == "" ) 
    Helper::halt( "no output file names given" );
  return std::visit( exporter_t( fif_file , csv_file , hp , lp ) , c );
}

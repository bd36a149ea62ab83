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

#include "main.h"
#include "param.h"

#include "pipeline/pipeline.h"
#include "db/db.h"
#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <Eigen/Core>
#include <fftw3.h>
#include <sqlite3.h>

#include <iostream>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <new>

extern logger_t logger;


int main( int argc , char ** argv )
{
  
  std::set_new_handler( NoMem );

  globals global;
  
  global.init_defs();

  //
  // display version info?
  //
  
  bool show_version = argc >= 2 
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );
  
  if ( show_version )  
    {
      std::cerr << eegprep_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< sqlite3_libversion() << "\n";
      std::cerr << fftw_version << "\n";
      std::exit( globals::retcode );
    }
  
  std::string usage_msg = eegprep_version() +
    "usage: eegprep <input.edf|input.fif> [key=value ...] [@param-file]\n"
    "  filter   lwr=1 upr=40 [tw=] [ripple=0.01]\n"
    "  ICA      nc=15 seed=97 maxit=auto tol=1e-4\n"
    "  EOG      eog=ch1,ch2 r-th=0.5 z-th=3\n"
    "  epochs   epoch epoch-len=2\n"
    "  output   fif=<stem>-clean.fif csv=<stem>-clean.csv\n"
    "           raw-plot=F clean-plot=F ic-plot=F o=out.db\n"
    "  misc     log=F silent verbose\n";
  
  if ( argc < 2 || argv[1][0] == '-' ) 
    {      
      std::cerr << usage_msg;
      std::exit( 1 );
    }

  try
    {
      
      const std::string input = argv[1];
      
      param_t param;
      
      build_param( &param , argc , argv , 2 );

      param.check( cmdline_keys() );
      
      if ( param.has( "silent" ) ) globals::silent = param.yesno( "silent" , false , true );
      if ( param.has( "verbose" ) ) globals::verbose = param.yesno( "verbose" , false , true );
      if ( param.has( "log" ) ) logger.write_log( param.requires( "log" ) );
      
      logger.banner( globals::version , globals::date );
      
      eegprep::options_t opt;
      opt.set( param );

      const std::string stem = Helper::file_stem( input );
      const std::string fif_file = param.has( "fif" ) ? param.requires( "fif" ) : stem + "-clean.fif";
      const std::string csv_file = param.has( "csv" ) ? param.requires( "csv" ) : stem + "-clean.csv";
      
      logger << " input: " << input << "\n";
      if ( param.size() != 0 ) 
	logger << " options:\n" << param.dump( "   " , "\n" ) << "\n";
      
      writer_t writer;
      if ( param.has( "o" ) && ! writer.attach( param.requires( "o" ) ) )
	Helper::halt( "could not attach " + param.requires( "o" ) );
      
      eegprep::preproc_result_t res = eegprep::preprocess( input , fif_file , csv_file , opt , &writer );

      //
      // optional plots
      //
      
      if ( param.has( "raw-plot" ) ) 
	eegprep::render_raw( res.raw , param.requires( "raw-plot" ) );
      
      if ( param.has( "clean-plot" ) ) 
	eegprep::render_cleaned( eegprep::cleaned_series( res.cleaned ) , param.requires( "clean-plot" ) );
      
      if ( param.has( "ic-plot" ) ) 
	eegprep::render_components( res.ica , res.raw , param.requires( "ic-plot" ) );
      
      writer.close();
      
      logger << " removed " << res.excludes.size() << " of " << res.ica.nc << " ICs (EOG " 
	     << eegprep::eog_status_label( res.eog.status ) << ")\n";

    }
  catch ( eegprep::eegprep_error & e )
    {
      std::cerr << "error : " << e.what() << "\n";
      globals::retcode = 1;
    }
  catch ( std::exception & e )
    {
      std::cerr << "error : " << e.what() << "\n";
      globals::retcode = 1;
    }
  
  std::exit( globals::retcode );
}


//
// construct parameters from the command line
//

void build_param( param_t * param , int argc , char** argv , int start )
{
  for (int i=start; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;
      if ( x[0] == '@' ) 
	param->read_file( x.substr(1) );
      else
	param->parse( x ); 
    }
}


std::set<std::string> cmdline_keys()
{
  std::set<std::string> k = eegprep::options_t::keys();
  k.insert( "fif" );
  k.insert( "csv" );
  k.insert( "raw-plot" );
  k.insert( "clean-plot" );
  k.insert( "ic-plot" );
  k.insert( "o" );
  k.insert( "log" );
  k.insert( "silent" );
  k.insert( "verbose" );
  return k;
}


//
// report eegprep version
//

std::string eegprep_version() 
{
  std::stringstream ss;
  ss << "eegprep version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "eegprep build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* You need a smaller dataset or a bigger computer...*\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}

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

#ifndef __EEGPREP_LOGGER_H__
#define	__EEGPREP_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;
  
  std::ofstream  _log_file;
  
  bool           is_off;

  bool           started;
  
  static std::string timestamp()
  {
    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);
    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);
    return BUFFER;
  }

  void both( const std::string & s )
  {
    _out_stream << s;
    if ( save_log ) _log_file << s;
  }
  
 public:
  
 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream ) 
  {
    is_off = false;
    save_log = false;
    started = false;
  }

  // mirror everything to a file as well as stderr
  void write_log( const std::string & log_file )
  {
    if ( is_off || globals::silent ) return;
    
    if ( save_log )
      stop_writing_log();
    
    _log_file.open( log_file.c_str() );
    save_log = _log_file.good();
  }
  
  void stop_writing_log()
  {
    if ( save_log )
      {
	_log_file.close();
	save_log = false;
      }
  }
  
  void flush() { _out_stream.flush(); if ( save_log ) _log_file.flush(); } 

  void off() { flush(); stop_writing_log(); is_off = true; } 

  void on() { is_off = false; }
  
  void banner( const std::string & v , const std::string & bd ) 
  {

    if ( is_off || globals::silent ) return;

    started = true;
    
    std::stringstream ss;
    ss << "===================================================================" << "\n"
       << _log_header
       << " | " << v << ", " << bd << " | starting " << timestamp() << " +++\n"
       << "===================================================================" << "\n";
    both( ss.str() );
    flush();
  }
   
  ~logger_t()
    {

      if ( is_off || globals::silent || ! started ) return;
      
      std::stringstream ss;
      ss << "-------------------------------------------------------------------"
	 << "\n"
	 << "+++ eegprep | finishing "
	 << timestamp()
	 << "                    +++\n"
	 << "==================================================================="
	 << "\n";
      both( ss.str() );
      flush();
      stop_writing_log();
    }

  void warning( const std::string & msg )
  {
    if ( is_off || globals::silent ) return ;
    both( " ** warning: " + msg + " ** \n" );
  }
  
  template<typename T>           
    logger_t& operator<< (const T& data) 
    {
      if ( is_off || globals::silent ) return *this;      
      _out_stream << data;
      if ( save_log )	
	_log_file << data;
      return *this;
    }

};

#endif

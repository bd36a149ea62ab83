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

#include "edf/edf.h"

#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cmath>
#include <cstring>
#include <map>
#include <set>
#include <iomanip>

extern logger_t logger;

static long edf_file_size( FILE * file )
{
  long lCurPos, lEndPos;
  lCurPos = ftell(file);
  fseek(file, 0, SEEK_END);
  lEndPos = ftell(file);
  fseek(file, lCurPos, SEEK_SET);
  return lEndPos;
}

int edf_t::get_int( byte_t ** p , int sz )
{
  std::string s = edf_t::get_string( p , sz );
  int t = 0;
  if ( ! Helper::str2int( s , &t ) ) 
    Helper::halt( "problem converting to an integer value: [" + s + "]"  );
  return t;
}

double edf_t::get_double( byte_t ** p , int sz )
{
  std::string s = edf_t::get_string( p , sz );
  double t = 0;
  if ( s == "" || ! Helper::from_string<double>( t , s , std::dec ) ) 
    Helper::halt( "problem converting to a numeric value: [" + s + "]" );
  return t;
}

std::string edf_t::get_string( byte_t ** p , int sz )
{
  // only US-ASCII printable characters allowed: 32 .. 126 
  // other characters mapped to '?'
  std::string str( sz , ' ' );
  for (int i=0;i<sz;i++)
    {
      char c = **p;
      if ( c < 32 || c > 126 ) c = '?';
      str[i] = c;
      ++(*p);      
    }
  return Helper::lrtrim( str );
}

double edf_t::volts( const std::string & dim )
{
  const std::string d = Helper::toupper( Helper::lrtrim( dim ) );
  if ( d == "V" ) return 1.0;
  if ( d == "MV" ) return 1e-3;
  // a (non-ASCII) micro sign reaches here as '?' (Latin-1) or '??' (UTF-8)
  if ( d == "UV" || d == "?V" || d == "??V" || d == "MICROV" ) return 1e-6;
  if ( d == "NV" ) return 1e-9;
  return 1.0;
}

long edf_header_t::record_size() const
{
  long sz = 0;
  for (int s=0;s<ns_all;s++) sz += 2 * n_samples[s];
  return sz;
}

void edf_header_t::read( FILE * file , const std::string & filename )
{

  // Total header = 256 + ns*256
  const int hdrSz = 256; 

  std::vector<byte_t> buf( hdrSz );
  
  if ( fread( &buf[0] , 1, hdrSz , file) != hdrSz )
    throw eegprep::io_failure_error( "could not read EDF header, file truncated: " + filename );

  byte_t * q = &buf[0];
  
  version        = edf_t::get_string( &q , 8 );
  patient_id     = edf_t::get_string( &q , 80 );
  recording_info = edf_t::get_string( &q , 80 );
  startdate      = edf_t::get_string( &q , 8 );
  starttime      = edf_t::get_string( &q , 8 );
  nbytes_header  = edf_t::get_int( &q , 8 );  
  reserved       = edf_t::get_string( &q , 44 );

  // EDF+C  continuous EDF 
  // EDF+D  discontinuous EDF+
  
  if ( reserved.size() >= 5 && reserved.substr( 0 , 4 ) == "EDF+" )
    {
      edfplus = true;
      continuous = reserved[4] != 'D';
    }
  else
    {
      edfplus = false;
      continuous = true;
    }

  if ( ! continuous ) 
    Helper::halt( "EDF+D (discontinuous) files are not supported: " + filename );
  
  nr                   = edf_t::get_int( &q , 8 );
  record_duration      = edf_t::get_double( &q , 8 );
  ns_all               = edf_t::get_int( &q , 4 );

  if ( ns_all < 1 ) 
    Helper::halt( "no signals in EDF " + filename );

  if ( ! ( record_duration > 0 ) )
    Helper::halt( "EDF record duration must be positive: " + filename );
  
  //
  // Per-signal header information
  //

  std::vector<byte_t> sbuf( hdrSz * ns_all );
  
  if ( fread( &sbuf[0] , 1, hdrSz * ns_all , file) != hdrSz * ns_all )
    throw eegprep::io_failure_error( "could not read EDF signal headers, file truncated: " + filename );
  
  byte_t * p = &sbuf[0];

  for (int s=0;s<ns_all;s++)
    {
      std::string l = edf_t::get_string( &p , 16 );
      annotation_channel.push_back( Helper::imatch( l , "EDF Annotation" , 14 ) );
      label.push_back( l );
    }

  for (int s=0;s<ns_all;s++)
    transducer_type.push_back( edf_t::get_string( &p , 80 ) );

  for (int s=0;s<ns_all;s++)
    phys_dimension.push_back( edf_t::get_string( &p , 8 ) );

  for (int s=0;s<ns_all;s++)
    physical_min.push_back( edf_t::get_double( &p , 8 ) );

  for (int s=0;s<ns_all;s++)
    physical_max.push_back( edf_t::get_double( &p , 8 ) );

  for (int s=0;s<ns_all;s++)
    digital_min.push_back( edf_t::get_int( &p , 8 ) );

  for (int s=0;s<ns_all;s++)
    digital_max.push_back( edf_t::get_int( &p , 8 ) );

  for (int s=0;s<ns_all;s++)
    prefiltering.push_back( edf_t::get_string( &p , 80 ) );
  
  for (int s=0;s<ns_all;s++)
    {
      int x = edf_t::get_int( &p , 8 );
      if ( x < 1 && ! annotation_channel[s] )
	Helper::halt( "signal " + label[s] + " has no samples per record" );
      n_samples.push_back( x );
    }

  for (int s=0;s<ns_all;s++)
    signal_reserved.push_back( edf_t::get_string( &p , 32 ) );

  //
  // derived values
  //
  
  for (int s=0;s<ns_all;s++)
    {
      if ( digital_max[s] == digital_min[s] ) 
	Helper::halt( "signal " + label[s] + " has equal digital min/max" );
      double bv = ( physical_max[s] - physical_min[s] ) / (double)( digital_max[s] - digital_min[s] ) ;
      if ( bv == 0 ) bv = 1; // flat channel, keep values finite
      bitvalue.push_back( bv );
      offset.push_back( ( physical_max[s] / bv ) - digital_max[s] ) ;
    }  
}

bool edf_header_t::start_time( std::time_t * t ) const
{
  // dd.mm.yy hh.mm.ss, 1985 clipping date for 2-digit years
  std::vector<std::string> d = Helper::parse( startdate , ".:/-" );
  std::vector<std::string> h = Helper::parse( starttime , ".:" );
  if ( d.size() != 3 || h.size() != 3 ) return false;

  int dd , mm , yy , hh , mi , ss;
  if ( ! ( Helper::str2int( d[0] , &dd ) && Helper::str2int( d[1] , &mm ) && Helper::str2int( d[2] , &yy ) ) ) return false;
  if ( ! ( Helper::str2int( h[0] , &hh ) && Helper::str2int( h[1] , &mi ) && Helper::str2int( h[2] , &ss ) ) ) return false;

  if ( yy < 100 ) yy += yy >= 85 ? 1900 : 2000;
  if ( mm < 1 || mm > 12 || dd < 1 || dd > 31 ) return false;
  
  struct tm tmv;
  memset( &tmv , 0 , sizeof( tmv ) );
  tmv.tm_year = yy - 1900;
  tmv.tm_mon = mm - 1;
  tmv.tm_mday = dd;
  tmv.tm_hour = hh;
  tmv.tm_min = mi;
  tmv.tm_sec = ss;
  *t = timegm( &tmv );
  return true;
}


eegprep::series_t edf_t::load( const std::string & f , eegprep::recording_source_t * src )
{

  filename = f;
  
  FILE * file = fopen( filename.c_str() , "rb" );
  if ( file == NULL )
    throw eegprep::io_failure_error( "could not open " + filename );

  const long fileSize = edf_file_size( file );

  try
    {
      header.read( file , filename );
    }
  catch ( const eegprep::eegprep_error & )
    {
      fclose( file );
      throw;
    }

  //
  // data channels, and their (single) sample rate
  //

  std::vector<int> slots;
  double sr = 0;
  
  for (int s=0;s<header.ns_all;s++)
    {
      if ( header.annotation_channel[s] ) continue;
      const double sr1 = header.n_samples[s] / header.record_duration;
      if ( slots.size() == 0 ) sr = sr1;
      else if ( fabs( sr - sr1 ) > 1e-8 ) 
	{
	  fclose( file );
	  Helper::halt( "all signals must have similar SR: " + header.label[s] + " is " 
			+ Helper::dbl2str( sr1 ) + " Hz, expecting " + Helper::dbl2str( sr ) + " Hz" );
	}
      slots.push_back( s );
    }

  if ( slots.size() == 0 )
    {
      fclose( file );
      Helper::halt( "no data channels in " + filename );
    }

  //
  // number of records: a -1 (unknown) is resolved from the file size
  //

  const long recSz = header.record_size();
  const long available = ( fileSize - header.nbytes_header ) / recSz;

  if ( header.nr < 0 ) header.nr = available;
  
  if ( available < header.nr )
    {
      fclose( file );
      throw eegprep::io_failure_error( "EDF truncated: expecting " + Helper::int2str( header.nr ) 
				       + " records, found " + Helper::int2str( available ) + " in " + filename );
    }

  // same rate, so the same count per record for every data channel
  const int nsmp = header.n_samples[ slots[0] ];
  const long total = (long)nsmp * header.nr;

  eegprep::series_t series;
  series.sr = sr;
  series.data.resize( slots.size() , total );

  // unique labels; roles guessed from labels
  std::set<std::string> seen;
  for (int i=0;i<slots.size();i++)
    {
      std::string l = header.label[ slots[i] ];
      std::string uc_l = Helper::toupper( l );
      if ( seen.find( uc_l ) != seen.end() )
	{
	  int inc = 1;
	  while ( seen.find( uc_l + "." + Helper::int2str( inc ) ) != seen.end() ) ++inc;
	  logger << "  uniquifying " << l;
	  l = l + "." + Helper::int2str( inc );
	  uc_l = Helper::toupper( l );
	  logger << " to " << l << "\n";
	}
      seen.insert( uc_l );
      series.labels.push_back( l );
      series.types.push_back( globals::map_channel( l ) );
    }

  //
  // records: int16, little-endian
  //

  fseek( file , header.nbytes_header , SEEK_SET );
  
  std::vector<byte_t> rec( recSz );
  
  for (int r=0;r<header.nr;r++)
    {
      if ( fread( &rec[0] , 1 , recSz , file ) != recSz )
	{
	  fclose( file );
	  throw eegprep::io_failure_error( "problem reading record " + Helper::int2str( r ) + " of " + filename );
	}
      
      const byte_t * p = &rec[0];
      int k = 0;
      
      for (int s=0;s<header.ns_all;s++)
	{
	  const int n = header.n_samples[s];

	  if ( k < slots.size() && slots[k] == s )
	    {
	      const double bv = header.bitvalue[s];
	      const double os = header.offset[s];
	      const double v = edf_t::volts( header.phys_dimension[s] );
	      const long base = (long)r * n;
	      for (int j=0;j<n;j++)
		{
		  int16_t d = (int16_t)( (uint16_t)p[0] | ( (uint16_t)p[1] << 8 ) );
		  series.data( k , base + j ) = bv * ( os + d ) * v;
		  p += 2;
		}
	      ++k;
	    }
	  else
	    p += 2 * n;
	}
    }

  fclose( file );

  if ( src != NULL )
    {
      src->path = filename;
      src->format = eegprep::FORMAT_EDF;
      std::time_t t;
      if ( header.start_time( &t ) ) src->set_date( t );
      else src->clear_date();
    }

  logger << "  read " << series.nchans() << " signals, " 
	 << header.nr << " records of " << header.record_duration << "s from " << filename 
	 << " (" << ( header.edfplus ? "EDF+" : "EDF" ) << ", " << sr << " Hz)\n";
  
  return series;
}

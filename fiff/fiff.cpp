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

#include "fiff/fiff.h"

#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <cstring>
#include <set>
#include <cmath>

extern logger_t logger;

//
// big-endian packing
//

static int32_t be_int( const unsigned char * p )
{
  uint32_t u = ( (uint32_t)p[0] << 24 ) | ( (uint32_t)p[1] << 16 ) | ( (uint32_t)p[2] << 8 ) | (uint32_t)p[3];
  int32_t i;
  memcpy( &i , &u , 4 );
  return i;
}

static int16_t be_short( const unsigned char * p )
{
  uint16_t u = ( (uint16_t)p[0] << 8 ) | (uint16_t)p[1];
  int16_t i;
  memcpy( &i , &u , 2 );
  return i;
}

static float be_float( const unsigned char * p )
{
  int32_t i = be_int( p );
  float f;
  memcpy( &f , &i , 4 );
  return f;
}

static double be_double( const unsigned char * p )
{
  uint64_t u = 0;
  for (int i=0;i<8;i++) u = ( u << 8 ) | (uint64_t)p[i];
  double d;
  memcpy( &d , &u , 8 );
  return d;
}

static void put_int( std::vector<unsigned char> & b , int32_t i )
{
  uint32_t u;
  memcpy( &u , &i , 4 );
  b.push_back( ( u >> 24 ) & 0xFF );
  b.push_back( ( u >> 16 ) & 0xFF );
  b.push_back( ( u >> 8 ) & 0xFF );
  b.push_back( u & 0xFF );
}

static void put_float( std::vector<unsigned char> & b , float f )
{
  int32_t i;
  memcpy( &i , &f , 4 );
  put_int( b , i );
}


channel_type_t fiff::kind2type( int kind )
{
  switch ( kind )
    {
    case FIFFV_EEG_CH : return EEG;
    case FIFFV_EOG_CH : return EOG;
    case FIFFV_ECG_CH : return ECG;
    case FIFFV_EMG_CH : return EMG;
    case FIFFV_STIM_CH : return STIM;
    default : return MISC;
    }
}

int fiff::type2kind( channel_type_t t )
{
  switch ( t )
    {
    case EOG : return FIFFV_EOG_CH;
    case ECG : return FIFFV_ECG_CH;
    case EMG : return FIFFV_EMG_CH;
    case STIM : return FIFFV_STIM_CH;
    case MISC : return FIFFV_MISC_CH;
    default : return FIFFV_EEG_CH;
    }
}


//
// tag_t
//

int32_t fiff::tag_t::as_int( int i ) const
{
  if ( data.size() < 4 * ( i + 1 ) ) Helper::halt( "bad FIFF tag " + Helper::int2str( kind ) + ": too short" );
  return be_int( &data[ 4 * i ] );
}

float fiff::tag_t::as_float( int i ) const
{
  if ( data.size() < 4 * ( i + 1 ) ) Helper::halt( "bad FIFF tag " + Helper::int2str( kind ) + ": too short" );
  return be_float( &data[ 4 * i ] );
}

std::vector<double> fiff::tag_t::as_vector() const
{
  std::vector<double> r;
  
  switch ( type )
    {
    case FIFFT_SHORT :
    case FIFFT_DAU_PACK16 :
      for (int i=0;i+1<data.size();i+=2) r.push_back( be_short( &data[i] ) );
      break;
    case FIFFT_INT :
      for (int i=0;i+3<data.size();i+=4) r.push_back( be_int( &data[i] ) );
      break;
    case FIFFT_FLOAT :
      for (int i=0;i+3<data.size();i+=4) r.push_back( be_float( &data[i] ) );
      break;
    case FIFFT_DOUBLE :
      for (int i=0;i+7<data.size();i+=8) r.push_back( be_double( &data[i] ) );
      break;
    default :
      Helper::halt( "unsupported FIFF data type " + Helper::int2str( type ) + " in tag " + Helper::int2str( kind ) );
    }
  return r;
}


//
// ch_info_t
//

void fiff::ch_info_t::decode( const std::vector<unsigned char> & buf )
{
  if ( buf.size() < CH_INFO_SIZE ) Helper::halt( "bad FIFF channel info record" );
  const unsigned char * p = &buf[0];
  scan_no   = be_int( p ); p += 4;
  log_no    = be_int( p ); p += 4;
  kind      = be_int( p ); p += 4;
  range     = be_float( p ); p += 4;
  cal       = be_float( p ); p += 4;
  coil_type = be_int( p ); p += 4;
  for (int i=0;i<12;i++) { loc[i] = be_float( p ); p += 4; }
  unit      = be_int( p ); p += 4;
  unit_mul  = be_int( p ); p += 4;
  std::string n( (const char*)p , CH_NAME_SIZE );
  const std::string::size_type z = n.find( '\0' );
  name = Helper::lrtrim( z == std::string::npos ? n : n.substr( 0 , z ) );
}

std::vector<unsigned char> fiff::ch_info_t::encode() const
{
  std::vector<unsigned char> b;
  put_int( b , scan_no );
  put_int( b , log_no );
  put_int( b , kind );
  put_float( b , range );
  put_float( b , cal );
  put_int( b , coil_type );
  for (int i=0;i<12;i++) put_float( b , loc[i] );
  put_int( b , unit );
  put_int( b , unit_mul );
  // NUL-padded, at most 15 characters
  for (int i=0;i<CH_NAME_SIZE;i++)
    b.push_back( i < name.size() && i < CH_NAME_SIZE - 1 ? (unsigned char)name[i] : 0 );
  return b;
}


//
// reader_t
//

fiff::reader_t::reader_t( const std::string & f ) : filename( f ) , file( NULL ) , file_size( 0 )
{
  file = fopen( filename.c_str() , "rb" );
  if ( file == NULL )
    throw eegprep::io_failure_error( "could not open " + filename );
  fseek( file , 0 , SEEK_END );
  file_size = ftell( file );
  fseek( file , 0 , SEEK_SET );
}

fiff::reader_t::~reader_t()
{
  if ( file != NULL ) fclose( file );
}

bool fiff::reader_t::next( tag_t * tag )
{

  const long pos = ftell( file );
  if ( pos >= file_size ) return false;
  
  unsigned char hdr[ TAG_HEADER_SIZE ];
  if ( fread( hdr , 1 , TAG_HEADER_SIZE , file ) != TAG_HEADER_SIZE )
    throw eegprep::io_failure_error( "FIFF truncated (tag header at byte " + Helper::int2str( pos ) + "): " + filename );

  tag->kind = be_int( hdr );
  tag->type = be_int( hdr + 4 );
  tag->size = be_int( hdr + 8 );
  tag->next = be_int( hdr + 12 );

  if ( tag->size < 0 || pos + TAG_HEADER_SIZE + (long)tag->size > file_size )
    throw eegprep::io_failure_error( "FIFF truncated (tag " + Helper::int2str( tag->kind ) + " at byte " + Helper::int2str( pos ) + "): " + filename );

  tag->data.resize( tag->size );
  if ( tag->size > 0 && fread( &tag->data[0] , 1 , tag->size , file ) != tag->size )
    throw eegprep::io_failure_error( "could not read FIFF tag data: " + filename );

  // non-sequential layout: follow the pointer
  if ( tag->next > 0 ) 
    fseek( file , tag->next , SEEK_SET );
  
  return true;
}


//
// writer_t
//

fiff::writer_t::writer_t( const std::string & f ) : filename( f ) , file( NULL )
{
  file = fopen( filename.c_str() , "wb" );
  if ( file == NULL )
    throw eegprep::io_failure_error( "could not open " + filename + " for writing" );
}

fiff::writer_t::~writer_t()
{
  if ( file != NULL ) fclose( file );
}

void fiff::writer_t::close()
{
  if ( file == NULL ) return;
  const bool ok = fflush( file ) == 0;
  fclose( file );
  file = NULL;
  if ( ! ok ) throw eegprep::io_failure_error( "problem writing " + filename );
}

void fiff::writer_t::write_tag( int kind , int type , const std::vector<unsigned char> & data , int next )
{
  std::vector<unsigned char> b;
  put_int( b , kind );
  put_int( b , type );
  put_int( b , data.size() );
  put_int( b , next );
  b.insert( b.end() , data.begin() , data.end() );
  if ( fwrite( &b[0] , 1 , b.size() , file ) != b.size() )
    throw eegprep::io_failure_error( "problem writing " + filename );
}

void fiff::writer_t::start_file()
{
  // file ID: version, machine ID (2), time (secs, usecs)
  std::vector<unsigned char> id;
  put_int( id , FIFFC_VERSION );
  put_int( id , 0 );
  put_int( id , 0 );
  put_int( id , (int32_t)time( NULL ) );
  put_int( id , 0 );
  write_tag( FIFF_FILE_ID , FIFFT_ID_STRUCT , id );

  // no directory
  std::vector<unsigned char> dp;
  put_int( dp , -1 );
  write_tag( FIFF_DIR_POINTER , FIFFT_INT , dp );

  std::vector<unsigned char> fl;
  put_int( fl , -1 );
  write_tag( FIFF_FREE_LIST , FIFFT_INT , fl );
}

void fiff::writer_t::end_file()
{
  write_tag( FIFF_NOP , FIFFT_VOID , std::vector<unsigned char>() , FIFFV_NEXT_NONE );
  close();
}

void fiff::writer_t::start_block( int kind )
{
  write_int( FIFF_BLOCK_START , kind );
}

void fiff::writer_t::end_block( int kind )
{
  write_int( FIFF_BLOCK_END , kind );
}

void fiff::writer_t::write_int( int kind , const std::vector<int32_t> & v )
{
  std::vector<unsigned char> b;
  for (int i=0;i<v.size();i++) put_int( b , v[i] );
  write_tag( kind , FIFFT_INT , b );
}

void fiff::writer_t::write_float( int kind , const std::vector<float> & v )
{
  std::vector<unsigned char> b;
  for (int i=0;i<v.size();i++) put_float( b , v[i] );
  write_tag( kind , FIFFT_FLOAT , b );
}

void fiff::writer_t::write_ch_info( const ch_info_t & ch )
{
  write_tag( FIFF_CH_INFO , FIFFT_CH_INFO_STRUCT , ch.encode() );
}

void fiff::writer_t::write_float_matrix( int kind , const std::vector<float> & v , const std::vector<int32_t> & dims )
{
  std::vector<unsigned char> b;
  b.reserve( 4 * v.size() + 4 * ( dims.size() + 1 ) );
  for (int i=0;i<v.size();i++) put_float( b , v[i] );
  // trailer: dims innermost first, then the dimension count
  for (int d=dims.size()-1;d>=0;d--) put_int( b , dims[d] );
  put_int( b , dims.size() );
  write_tag( kind , FIFFT_MATRIX | FIFFT_FLOAT , b );
}


//
// high-level I/O
//

std::vector<std::string> fiff::channel_names( const std::vector<std::string> & labels )
{
  const int mx = CH_NAME_SIZE - 1;

  std::set<std::string> used;
  for (int c=0;c<labels.size();c++)
    if ( labels[c].size() <= mx ) used.insert( labels[c] );
  
  std::vector<std::string> names( labels );
  
  for (int c=0;c<labels.size();c++)
    {
      if ( labels[c].size() <= mx ) continue;
      
      std::string n = labels[c].substr( 0 , mx );
      int k = 0;
      while ( used.find( n ) != used.end() )
	{
	  const std::string sfx = "-" + Helper::int2str( k++ );
	  n = labels[c].substr( 0 , mx - sfx.size() ) + sfx;
	}
      used.insert( n );
      names[c] = n;
      logger.warning( "channel " + labels[c] + " written to FIFF as " + n + " (max 15 characters)" );
    }
  return names;
}

static void write_meas_info( fiff::writer_t & w , const eegprep::series_t & s ,
			     const eegprep::recording_source_t * src ,
			     double highpass , double lowpass )
{
  const std::vector<std::string> names = fiff::channel_names( s.labels );

  w.start_block( fiff::FIFFB_MEAS_INFO );
  w.write_int( fiff::FIFF_NCHAN , s.nchans() );
  w.write_float( fiff::FIFF_SFREQ , (float)s.sr );
  w.write_float( fiff::FIFF_HIGHPASS , (float)highpass );
  w.write_float( fiff::FIFF_LOWPASS , (float)( lowpass > 0 ? lowpass : s.sr / 2.0 ) );

  if ( src != NULL && src->has_date )
    {
      std::vector<int32_t> d( 2 , 0 );
      d[0] = (int32_t)src->meas_date;
      w.write_int( fiff::FIFF_MEAS_DATE , d );
    }
  
  for (int c=0;c<s.nchans();c++)
    {
      fiff::ch_info_t ch;
      ch.scan_no = c + 1;
      ch.log_no = c + 1;
      ch.kind = fiff::type2kind( s.types[c] );
      ch.coil_type = ch.kind == fiff::FIFFV_EEG_CH ? fiff::FIFFV_COIL_EEG : fiff::FIFFV_COIL_NONE;
      ch.unit = s.types[c] == STIM || s.types[c] == MISC ? fiff::FIFF_UNIT_NONE : fiff::FIFF_UNIT_V;
      ch.name = names[c];
      w.write_ch_info( ch );
    }
  w.end_block( fiff::FIFFB_MEAS_INFO );
}


void fiff::write_raw( const eegprep::series_t & s , const std::string & filename ,
		      const eegprep::recording_source_t * src ,
		      double highpass , double lowpass )
{

  s.validate();
  
  writer_t w( filename );
  w.start_file();
  w.start_block( FIFFB_MEAS );
  write_meas_info( w , s , src , highpass , lowpass );

  w.start_block( FIFFB_RAW_DATA );
  w.write_int( FIFF_FIRST_SAMPLE , 0 );

  // buffers of (up to) 1 second, sample-major
  const int nc = s.nchans();
  const int n = s.nsamples();
  const int bufsz = s.sr >= 1 ? (int)s.sr : 1 ;

  for (int start = 0 ; start < n ; start += bufsz )
    {
      const int len = start + bufsz > n ? n - start : bufsz ;
      std::vector<float> v( (long)len * nc );
      long k = 0;
      for (int j=0;j<len;j++)
	for (int c=0;c<nc;c++)
	  v[k++] = (float)s.data( c , start + j );
      w.write_float( FIFF_DATA_BUFFER , v );
    }
  
  w.end_block( FIFFB_RAW_DATA );
  w.end_block( FIFFB_MEAS );
  w.end_file();

  logger << "  wrote " << nc << " x " << n << " raw FIFF to " << filename << "\n";
}


void fiff::write_epochs( const eegprep::epoched_t & e , const std::string & filename ,
			 const eegprep::recording_source_t * src ,
			 double highpass , double lowpass )
{
  if ( e.nepochs() == 0 )
    Helper::halt( "no epochs to write to " + filename );

  const eegprep::series_t & s0 = e.epochs[0];
  s0.validate();
  
  writer_t w( filename );
  w.start_file();
  w.start_block( FIFFB_MEAS );
  write_meas_info( w , s0 , src , highpass , lowpass );

  w.start_block( FIFFB_PROCESSED_DATA );
  w.start_block( FIFFB_MNE_EPOCHS );

  // tmin = 0
  w.write_int( FIFF_FIRST_SAMPLE , 0 );
  w.write_int( FIFF_LAST_SAMPLE , e.window - 1 );

  const int nc = s0.nchans();
  std::vector<float> v( (long)e.nepochs() * nc * e.window );
  long k = 0;
  for (int ep=0;ep<e.nepochs();ep++)
    for (int c=0;c<nc;c++)
      for (int j=0;j<e.window;j++)
	v[k++] = (float)e.epochs[ep].data( c , j );

  std::vector<int32_t> dims( 3 );
  dims[0] = e.nepochs();
  dims[1] = nc;
  dims[2] = e.window;
  w.write_float_matrix( FIFF_EPOCH , v , dims );
  
  w.end_block( FIFFB_MNE_EPOCHS );
  w.end_block( FIFFB_PROCESSED_DATA );
  w.end_block( FIFFB_MEAS );
  w.end_file();

  logger << "  wrote " << e.nepochs() << " epochs of " << nc << " x " << e.window << " to " << filename << "\n";
}


eegprep::series_t fiff::read( const std::string & filename , eegprep::recording_source_t * src , std::vector<eegprep::series_t> * epochs )
{

  reader_t r( filename );

  tag_t tag;

  // first tag must be the file ID
  if ( ! r.next( &tag ) || tag.kind != FIFF_FILE_ID )
    throw eegprep::io_failure_error( "not a FIFF file (no file ID): " + filename );
  
  std::vector<int> blocks;

  int nchan = -1;
  double sfreq = 0;
  bool has_date = false;
  std::time_t meas_date = 0;
  std::vector<ch_info_t> chs;
  
  // raw buffers, each samples x channels (sample-major)
  std::vector<std::vector<double> > buffers;
  std::vector<int> skips; // buffers of zeros, placed before buffers[i]
  int pending_skip = 0;

  // epochs matrix
  std::vector<double> ep_data;
  int ep_n = 0 , ep_c = 0 , ep_t = 0;

  // stack depth of the top-level measurement info block while open
  // (dig, HPI, projector ... blocks nest inside it)
  int info_depth = -1;
  bool seen_info = false;
  
  while ( r.next( &tag ) )
    {

      if ( tag.kind == FIFF_BLOCK_START )
	{
	  const int b = tag.as_int();
	  if ( b == FIFFB_MEAS_INFO && ! seen_info && info_depth == -1 
	       && blocks.size() > 0 && blocks.back() == FIFFB_MEAS )
	    info_depth = blocks.size();
	  blocks.push_back( b );
	  continue;
	}

      if ( tag.kind == FIFF_BLOCK_END )
	{
	  if ( blocks.size() == 0 ) 
	    Helper::halt( "unbalanced FIFF block end in " + filename );
	  if ( info_depth == (int)blocks.size() - 1 ) 
	    {
	      seen_info = true;
	      info_depth = -1;
	    }
	  blocks.pop_back();
	  continue;
	}

      if ( blocks.size() == 0 ) continue;
      
      const int block = blocks.back();
      
      // ignore NCHAN/SFREQ of nested (e.g. HPI) blocks
      if ( info_depth != -1 && (int)blocks.size() - 1 == info_depth )
	{
	  if ( tag.kind == FIFF_NCHAN ) nchan = tag.as_int();
	  else if ( tag.kind == FIFF_SFREQ ) sfreq = tag.as_float();
	  else if ( tag.kind == FIFF_MEAS_DATE ) 
	    {
	      has_date = true;
	      meas_date = tag.as_int( 0 );
	    }
	  else if ( tag.kind == FIFF_CH_INFO )
	    {
	      ch_info_t ch;
	      ch.decode( tag.data );
	      chs.push_back( ch );
	    }
	  continue;
	}

      if ( block == FIFFB_RAW_DATA || block == FIFFB_CONTINUOUS_DATA )
	{
	  if ( tag.kind == FIFF_DATA_BUFFER )
	    {
	      buffers.push_back( tag.as_vector() );
	      skips.push_back( pending_skip );
	      pending_skip = 0;
	    }
	  else if ( tag.kind == FIFF_DATA_SKIP )
	    pending_skip += tag.as_int();
	  continue;
	}

      if ( block == FIFFB_MNE_EPOCHS && tag.kind == FIFF_EPOCH )
	{
	  if ( ( tag.type & FIFFT_MATRIX ) == 0 || tag.size < 16 )
	    Helper::halt( "expecting a 3D matrix for FIFF epochs in " + filename );
	  const int base = tag.type & ~FIFFT_MATRIX;
	  const int ndim = be_int( &tag.data[ tag.size - 4 ] );
	  if ( ndim != 3 ) 
	    Helper::halt( "expecting a 3D matrix for FIFF epochs in " + filename );
	  ep_t = be_int( &tag.data[ tag.size - 16 ] );
	  ep_c = be_int( &tag.data[ tag.size - 12 ] );
	  ep_n = be_int( &tag.data[ tag.size - 8 ] );
	  const int w = base == FIFFT_DOUBLE ? 8 : 4;
	  const long total = (long)ep_n * ep_c * ep_t;
	  if ( total * w + 16 != tag.size )
	    throw eegprep::io_failure_error( "FIFF epochs matrix size mismatch in " + filename );
	  ep_data.resize( total );
	  for (long i=0;i<total;i++)
	    ep_data[i] = base == FIFFT_DOUBLE ? be_double( &tag.data[ 8 * i ] ) : 
	      base == FIFFT_INT ? be_int( &tag.data[ 4 * i ] ) : be_float( &tag.data[ 4 * i ] );
	  continue;
	}
    }

  //
  // checks
  //

  if ( ! seen_info )
    throw eegprep::io_failure_error( "no measurement info in " + filename );
  
  if ( nchan < 1 || chs.size() != nchan )
    Helper::halt( "FIFF channel info inconsistent (" + Helper::int2str( (int)chs.size() ) + " of " 
		  + Helper::int2str( nchan ) + " channels) in " + filename );

  if ( ! ( sfreq > 0 ) )
    Helper::halt( "no sample rate in " + filename );

  eegprep::series_t s;
  s.sr = sfreq;
  for (int c=0;c<nchan;c++)
    {
      s.labels.push_back( chs[c].name );
      s.types.push_back( kind2type( chs[c].kind ) );
    }

  //
  // raw: concatenate buffers, with calibration
  //
  
  if ( buffers.size() != 0 )
    {
      long n = 0;
      int bufn = 0;
      for (int b=0;b<buffers.size();b++)
	{
	  if ( buffers[b].size() % nchan != 0 )
	    Helper::halt( "FIFF data buffer not a multiple of the channel count in " + filename );
	  bufn = buffers[b].size() / nchan;
	  n += (long)skips[b] * bufn + bufn;
	}

      s.data = Eigen::MatrixXd::Zero( nchan , n );

      long t = 0;
      for (int b=0;b<buffers.size();b++)
	{
	  const int len = buffers[b].size() / nchan;
	  t += (long)skips[b] * len;
	  long k = 0;
	  for (int j=0;j<len;j++)
	    for (int c=0;c<nchan;c++)
	      s.data( c , t + j ) = buffers[b][k++] * chs[c].cal * chs[c].range;
	  t += len;
	}
    }
  else if ( ep_n > 0 )
    {
      if ( ep_c != nchan )
	Helper::halt( "FIFF epochs channel count does not match info in " + filename );
      
      s.data.resize( nchan , (long)ep_n * ep_t );
      long k = 0;
      for (int e=0;e<ep_n;e++)
	{
	  eegprep::series_t w;
	  if ( epochs != NULL )
	    {
	      w.labels = s.labels;
	      w.types = s.types;
	      w.sr = s.sr;
	      w.data.resize( nchan , ep_t );
	    }
	  for (int c=0;c<nchan;c++)
	    for (int j=0;j<ep_t;j++)
	      {
		const double x = ep_data[k++] * chs[c].cal * chs[c].range;
		s.data( c , (long)e * ep_t + j ) = x;
		if ( epochs != NULL ) w.data( c , j ) = x;
	      }
	  if ( epochs != NULL ) epochs->push_back( w );
	}
    }
  else
    Helper::halt( "no raw data buffers or epochs in " + filename );

  s.validate();
  
  if ( src != NULL )
    {
      src->path = filename;
      src->format = eegprep::FORMAT_FIF;
      if ( has_date ) src->set_date( meas_date );
      else src->clear_date();
    }

  logger << "  read " << s.nchans() << " channels, " << s.nsamples() << " samples (" 
	 << sfreq << " Hz) from " << filename 
	 << ( ep_n > 0 && buffers.size() == 0 ? " [" + Helper::int2str( ep_n ) + " epochs]" : "" ) << "\n";
  
  return s;
}

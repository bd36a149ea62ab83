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

#ifndef __EEGPREP_FIFF_H__
#define __EEGPREP_FIFF_H__

#include <string>
#include <vector>
#include <cstdio>
#include <stdint.h>

#include "eeg/series.h"

//
// Neuromag / MNE FIFF: tagged, big-endian, nested blocks
//

namespace fiff {

  // tags
  const int FIFF_FILE_ID          = 100;
  const int FIFF_DIR_POINTER      = 101;
  const int FIFF_BLOCK_ID         = 103;
  const int FIFF_BLOCK_START      = 104;
  const int FIFF_BLOCK_END        = 105;
  const int FIFF_FREE_LIST        = 106;
  const int FIFF_NOP              = 108;
  const int FIFF_NCHAN            = 200;
  const int FIFF_SFREQ            = 201;
  const int FIFF_CH_INFO          = 203;
  const int FIFF_MEAS_DATE        = 204;
  const int FIFF_FIRST_SAMPLE     = 208;
  const int FIFF_LAST_SAMPLE      = 209;
  const int FIFF_LOWPASS          = 219;
  const int FIFF_HIGHPASS         = 223;
  const int FIFF_DATA_BUFFER      = 300;
  const int FIFF_DATA_SKIP        = 301;
  const int FIFF_EPOCH            = 302;

  // blocks
  const int FIFFB_MEAS            = 100;
  const int FIFFB_MEAS_INFO       = 101;
  const int FIFFB_RAW_DATA        = 102;
  const int FIFFB_PROCESSED_DATA  = 103;
  const int FIFFB_ISOTRAK         = 107;
  const int FIFFB_HPI_MEAS        = 108;
  const int FIFFB_CONTINUOUS_DATA = 112;
  const int FIFFB_PROJ            = 313;
  const int FIFFB_MNE_EPOCHS      = 373;

  // data types
  const int FIFFT_VOID            = 0;
  const int FIFFT_SHORT           = 2;
  const int FIFFT_INT             = 3;
  const int FIFFT_FLOAT           = 4;
  const int FIFFT_DOUBLE          = 5;
  const int FIFFT_STRING          = 10;
  const int FIFFT_DAU_PACK16      = 16;
  const int FIFFT_CH_INFO_STRUCT  = 30;
  const int FIFFT_ID_STRUCT       = 31;
  const int FIFFT_MATRIX          = 0x40000000;

  const int FIFFV_NEXT_SEQ        = 0;
  const int FIFFV_NEXT_NONE       = -1;
  const int FIFFC_VERSION         = 0x00010003;

  // channel kinds
  const int FIFFV_MEG_CH          = 1;
  const int FIFFV_EEG_CH          = 2;
  const int FIFFV_STIM_CH         = 3;
  const int FIFFV_EOG_CH          = 202;
  const int FIFFV_EMG_CH          = 302;
  const int FIFFV_ECG_CH          = 402;
  const int FIFFV_MISC_CH         = 502;

  const int FIFFV_COIL_NONE       = 0;
  const int FIFFV_COIL_EEG        = 1;
  
  const int FIFF_UNIT_NONE        = -1;
  const int FIFF_UNIT_V           = 107;
  
  // on-disk sizes
  const int TAG_HEADER_SIZE       = 16;
  const int CH_INFO_SIZE          = 96;
  const int CH_NAME_SIZE          = 16;
  const int ID_SIZE               = 20;
  
  channel_type_t kind2type( int kind );

  int type2kind( channel_type_t t );

  //
  // one tag: header + payload
  //
  
  struct tag_t
  {
    tag_t() : kind(0), type(0), size(0), next(0) { } 

    int32_t kind;
    int32_t type;
    int32_t size;
    int32_t next;
    std::vector<unsigned char> data;

    int32_t as_int( int i = 0 ) const;
    float as_float( int i = 0 ) const;

    // numeric payload of a (non-matrix) tag as doubles
    std::vector<double> as_vector() const;
  };

  
  //
  // channel description (fiffChInfoRec)
  //
  
  struct ch_info_t
  {
    ch_info_t() : scan_no(0), log_no(0), kind(FIFFV_EEG_CH), range(1), cal(1), coil_type(FIFFV_COIL_EEG), unit(FIFF_UNIT_V), unit_mul(0) 
    {
      for (int i=0;i<12;i++) loc[i] = 0;
    }
    
    int32_t scan_no;
    int32_t log_no;
    int32_t kind;
    float range;
    float cal;
    int32_t coil_type;
    float loc[12];
    int32_t unit;
    int32_t unit_mul;
    std::string name;

    void decode( const std::vector<unsigned char> & buf );
    std::vector<unsigned char> encode() const;
  };


  //
  // sequential reader
  //

  struct reader_t
  {
    reader_t( const std::string & filename );

    ~reader_t();
    
    // false at end of file
    bool next( tag_t * tag );
    
  private:

    reader_t( const reader_t & );
    reader_t & operator=( const reader_t & );

    std::string filename;
    FILE * file;
    long file_size;
  };


  //
  // sequential writer
  //

  struct writer_t
  {
    writer_t( const std::string & filename );

    ~writer_t();

    void start_file();
    void end_file();
    
    void start_block( int kind );
    void end_block( int kind );

    void write_int( int kind , const std::vector<int32_t> & v );
    void write_int( int kind , int32_t v ) { write_int( kind , std::vector<int32_t>( 1 , v ) ); }
    void write_float( int kind , const std::vector<float> & v );
    void write_float( int kind , float v ) { write_float( kind , std::vector<float>( 1 , v ) ); }
    void write_ch_info( const ch_info_t & ch );

    // n-dimensional float matrix, C order, dims as given (outermost first)
    void write_float_matrix( int kind , const std::vector<float> & v , const std::vector<int32_t> & dims );
    
    void close();
    
  private:

    writer_t( const writer_t & );
    writer_t & operator=( const writer_t & );

    void write_tag( int kind , int type , const std::vector<unsigned char> & data , int next = FIFFV_NEXT_SEQ );
    
    std::string filename;
    FILE * file;
  };

  
  //
  // high-level: raw (continuous) and MNE-style epochs files
  //

  // FIFF channel names hold 15 characters: longer labels are cut, with
  // a "-N" suffix where the cut name is already taken
  std::vector<std::string> channel_names( const std::vector<std::string> & labels );
  
  // a raw file; for an epochs file, the windows joined end to end (and
  // optionally each window)
  eegprep::series_t read( const std::string & filename , eegprep::recording_source_t * src , std::vector<eegprep::series_t> * epochs = NULL );

  // measurement date is omitted unless src says otherwise
  void write_raw( const eegprep::series_t & s , const std::string & filename ,
		  const eegprep::recording_source_t * src = NULL ,
		  double highpass = 0 , double lowpass = 0 );

  void write_epochs( const eegprep::epoched_t & e , const std::string & filename ,
		     const eegprep::recording_source_t * src = NULL ,
		     double highpass = 0 , double lowpass = 0 );
  
}

#endif

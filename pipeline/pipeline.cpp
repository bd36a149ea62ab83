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

#include "pipeline/pipeline.h"

#include "eeg/reader.h"
#include "ica/ica-apply.h"
#include "timeline/epochs.h"
#include "db/db.h"
#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


//
// options
//

std::set<std::string> eegprep::options_t::keys()
{
  std::set<std::string> k;
  k.insert( "lwr" );
  k.insert( "upr" );
  k.insert( "tw" );
  k.insert( "ripple" );
  k.insert( "nc" );
  k.insert( "seed" );
  k.insert( "maxit" );
  k.insert( "tol" );
  k.insert( "epoch" );
  k.insert( "epoch-len" );
  k.insert( "eog" );
  k.insert( "r-th" );
  k.insert( "z-th" );
  return k;
}

void eegprep::options_t::set( const param_t & param )
{

  if ( param.has( "lwr" ) ) filter.lwr = param.requires_dbl( "lwr" );
  if ( param.has( "upr" ) ) filter.upr = param.requires_dbl( "upr" );
  if ( param.has( "tw" ) ) filter.tw = param.requires_dbl( "tw" );
  if ( param.has( "ripple" ) ) filter.ripple = param.requires_dbl( "ripple" );

  if ( ! ( filter.lwr > 0 && filter.upr > filter.lwr ) ) 
    Helper::halt( "expecting 0 < lwr < upr" );
  
  if ( param.has( "nc" ) ) 
    {
      ica.nc = param.requires_int( "nc" );
      if ( ica.nc < 1 ) Helper::halt( "nc must be a positive integer" );
    }

  if ( param.has( "seed" ) )
    {
      const int s = param.requires_int( "seed" );
      if ( s < 0 ) Helper::halt( "seed must be non-negative" );
      ica.seed = s;
    }
  
  if ( param.has( "maxit" ) )
    {
      if ( Helper::iequals( param.value( "maxit" ) , "auto" ) ) 
	ica.maxit = -1;
      else
	{
	  ica.maxit = param.requires_int( "maxit" );
	  if ( ica.maxit < 1 ) Helper::halt( "maxit must be 'auto' or a positive integer" );
	}
    }

  if ( param.has( "tol" ) ) ica.tol = param.requires_dbl( "tol" );

  if ( param.has( "r-th" ) ) eog.r_th = param.requires_dbl( "r-th" );
  if ( param.has( "z-th" ) ) eog.z_th = param.requires_dbl( "z-th" );
  
  epoch = param.yesno( "epoch" , false , true );
  
  if ( param.has( "epoch-len" ) ) 
    {
      epoch = true;
      epoch_length = param.requires_dbl( "epoch-len" );
      if ( ! ( epoch_length > 0 ) ) Helper::halt( "epoch-len must be positive" );
    }

  if ( param.has( "eog" ) ) eog_channels = param.strvector( "eog" );
  
}


eegprep::series_t eegprep::cleaned_series( const cleaned_t & c )
{
  if ( std::holds_alternative<continuous_t>( c ) )
    return std::get<continuous_t>( c ).series;
  
  const epoched_t & e = std::get<epoched_t>( c );
  if ( e.nepochs() == 0 ) Helper::halt( "no epochs" );
  
  series_t s;
  s.labels = e.epochs[0].labels;
  s.types = e.epochs[0].types;
  s.sr = e.epochs[0].sr;
  s.data.resize( e.epochs[0].nchans() , e.nepochs() * e.window );
  for (int i=0;i<e.nepochs();i++)
    s.data.block( 0 , i * e.window , s.nchans() , e.window ) = e.epochs[i].data;
  return s;
}


//
// the pipeline
//

eegprep::preproc_result_t eegprep::preprocess( const std::string & input , 
					       const std::string & fif_file , 
					       const std::string & csv_file , 
					       const options_t & opt ,
					       writer_t * writer )
{

  // unknown extensions fail here, before anything else
  detect_format( input );
  
  preproc_result_t res;
  
  //
  // read
  //

  recording_t rec = read_recording( input );

  res.source = rec.source;

  if ( opt.eog_channels.size() != 0 ) 
    {
      rec.series.set_type( opt.eog_channels , EOG );
      logger << "  set " << Helper::stringize( opt.eog_channels ) << " as EOG\n";
    }

  if ( writer != NULL )
    {
      // ID is the file name without folder or extension
      std::string id = Helper::file_stem( input );
      std::string::size_type slash = id.find_last_of( "/\\" );
      if ( slash != std::string::npos ) id = id.substr( slash + 1 );
      writer->id( id , input );
      writer->cmd( "READ" , input );
      writer->value( "NS" , rec.series.nchans() );
      writer->value( "SR" , rec.series.sr );
      writer->value( "NSAMP" , rec.series.nsamples() );
      writer->value( "DUR" , rec.series.duration() );
      for (int c=0;c<rec.series.nchans();c++)
	{
	  writer->level( rec.series.labels[c] , globals::signal_strat );
	  writer->value( "TYPE" , globals::map_channel_label( rec.series.types[c] ) );
	}
      writer->unlevel( globals::signal_strat );
    }
  
  //
  // band-pass
  //
  
  logger << " filtering " << rec.series.nchans() << " channels, " << opt.filter.label() << "\n";
  
  res.raw = dsptools::apply_fir( rec.series , opt.filter , &res.ntaps );

  if ( writer != NULL )
    {
      writer->cmd( "FILTER" , opt.filter.label() );
      writer->value( "LWR" , opt.filter.lwr );
      writer->value( "UPR" , opt.filter.upr );
      writer->value( "TW" , opt.filter.transition() );
      writer->value( "RIPPLE" , opt.filter.ripple );
      writer->value( "NTAPS" , res.ntaps );

      // magnitude response at the band edges and half a transition
      // width beyond them
      const double tw = opt.filter.transition();
      std::vector<double> fc = dsptools::design_bandpass_fir( opt.filter.ripple , tw , res.raw.sr , 
							     opt.filter.lwr , opt.filter.upr );
      std::vector<double> frq;
      if ( opt.filter.lwr - tw / 2.0 > 0 ) frq.push_back( opt.filter.lwr - tw / 2.0 );
      frq.push_back( opt.filter.lwr );
      frq.push_back( opt.filter.upr );
      if ( opt.filter.upr + tw / 2.0 < res.raw.sr / 2.0 ) frq.push_back( opt.filter.upr + tw / 2.0 );
      std::vector<double> h = fir_t::response( fc , res.raw.sr , frq );
      for (int i=0;i<frq.size();i++)
	{
	  writer->level( Helper::dbl2str( frq[i] ) , globals::freq_strat );
	  writer->value( "H" , h[i] );
	}
      writer->unlevel( globals::freq_strat );
    }
  
  //
  // ICA
  //

  logger << " running ICA\n";
  
  res.ica = fit_ica( res.raw , opt.ica );

  if ( writer != NULL )
    {
      writer->cmd( "ICA" );
      writer->value( "NC_REQ" , res.ica.nc_req );
      writer->value( "NC" , res.ica.nc );
      writer->value( "ITER" , res.ica.iterations );
      writer->value( "CONV" , (int)res.ica.converged );
    }
  
  //
  // EOG-correlated components
  //

  logger << " detecting EOG components\n";
  
  res.eog = detect_eog( res.raw , res.ica , opt.eog );
  
  res.excludes = res.eog.excludes();

  if ( writer != NULL )
    {
      writer->cmd( "EOG" );
      writer->value( "STATUS" , eog_status_label( res.eog.status ) );
      writer->value( "NEXCL" , (int)res.excludes.size() );
      if ( res.eog.status == EOG_FAILED ) 
	writer->value( "REASON" , res.eog.reason );
      
      for (int e=0;e<res.eog.scores.size();e++)
	{
	  writer->level( res.eog.refs[e] , globals::signal_strat );
	  for (int i=0;i<res.eog.scores[e].size();i++)
	    {
	      writer->level( i+1 , globals::ic_strat );
	      writer->value( "R" , res.eog.scores[e][i] );
	      writer->value( "Z" , res.eog.z[e][i] );
	      writer->value( "EXCL" , (int)res.excludes.count( i ) );
	    }
	  writer->unlevel( globals::ic_strat );
	}
      writer->unlevel( globals::signal_strat );
    }

  //
  // reconstruct
  //

  series_t cleaned = apply_ica( res.raw , res.ica , res.excludes );

  if ( opt.epoch )
    res.cleaned = make_epochs( cleaned , opt.epoch_length );
  else
    {
      continuous_t c;
      c.series = cleaned;
      res.cleaned = c;
    }

  //
  // export
  //

  logger << " writing cleaned data\n";
  
  res.exported = export_cleaned( res.cleaned , fif_file , csv_file , opt.filter.lwr , opt.filter.upr );

  if ( writer != NULL )
    {
      writer->cmd( "EXPORT" );
      writer->value( "FIF" , fif_file );
      writer->value( "CSV" , csv_file );
      writer->value( "ROWS" , res.exported.rows );
      writer->value( "COLS" , res.exported.cols );
      if ( res.exported.epoched )
	{
	  const epoched_t & e = std::get<epoched_t>( res.cleaned );
	  writer->value( "NE" , res.exported.nepochs );
	  writer->value( "WIN" , e.window );
	  for (int i=0;i<e.nepochs();i++)
	    {
	      writer->level( i+1 , globals::epoch_strat );
	      writer->value( "ONSET" , e.onsets[i] / res.raw.sr );
	    }
	  writer->unlevel( globals::epoch_strat );
	}
    }
  
  return res;
}

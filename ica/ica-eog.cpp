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

#include "ica/ica-eog.h"

#include "dsp/fir.h"
#include "stats/statistics.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


std::string eegprep::eog_status_label( eog_status_t s )
{
  if ( s == EOG_DETECTED ) return "DETECTED";
  if ( s == EOG_SKIPPED ) return "SKIPPED";
  return "FAILED";
}

std::set<int> eegprep::eog_result_t::excludes() const
{
  std::set<int> r;
  if ( status != EOG_DETECTED ) return r;
  r.insert( indices.begin() , indices.end() );
  return r;
}


// flags components for one reference; scores in abs(r)

static std::set<int> flag_components( const std::vector<double> & r , 
				      const eegprep::eog_options_t & opt ,
				      std::vector<double> * z )
{
  
  const int nc = r.size();
  
  std::vector<double> ar( nc );
  for (int i=0;i<nc;i++) ar[i] = fabs( r[i] );
  
  std::set<int> flagged;
  for (int i=0;i<nc;i++)
    if ( ar[i] >= opt.r_th ) flagged.insert( i );
  
  z->clear();
  
  std::vector<bool> excl( nc , false );
  
  for (int pass=0; pass < opt.passes; pass++)
    {
      for (int i=0;i<nc;i++) excl[i] = flagged.count(i);

      // need at least two remaining components to standardize
      if ( nc - (int)flagged.size() < 2 ) break;
      
      std::vector<double> zz = Statistics::zscores( ar , &excl );
      
      if ( pass == 0 ) *z = zz;

      int added = 0;
      for (int i=0;i<nc;i++)
	{
	  if ( excl[i] ) continue;
	  if ( ! Helper::realnum( zz[i] ) ) 
	    throw eegprep::detection_failure_error( "non-finite z-score" );
	  if ( zz[i] > opt.z_th ) { flagged.insert( i ); ++added; }
	}
      
      if ( added == 0 ) break;
    }

  if ( z->size() == 0 ) z->resize( nc , 0 );
  
  return flagged;
}


eegprep::eog_result_t eegprep::detect_eog( const series_t & s , const ica_model_t & m , const eog_options_t & opt )
{

  eog_result_t res;
  
  std::vector<int> eogs = s.channels( EOG );
  
  if ( eogs.size() == 0 ) 
    {
      res.status = EOG_SKIPPED;
      res.reason = "no EOG channels";
      logger << "  no EOG channels, skipping automatic IC rejection\n";
      return res;
    }

  for (int i=0;i<eogs.size();i++) res.refs.push_back( s.labels[ eogs[i] ] );
  
  logger << "  scoring " << m.nc << " ICs against " << eogs.size() 
	 << " EOG channel(s): " << Helper::stringize( res.refs ) << "\n";
  
  // detection_failure_error, or a filter/projection error
  try
    {
      
      if ( m.nc < 1 ) 
	throw detection_failure_error( "model has no components" );

      //
      // sources and references, each band-limited
      //
      
      series_t src;
      src.sr = s.sr;
      src.data = m.sources( s );
      for (int i=0;i<m.nc;i++)
	{
	  src.labels.push_back( "IC" + Helper::int2str( i+1 ) );
	  src.types.push_back( MISC );
	}
      
      series_t ref;
      ref.sr = s.sr;
      ref.data.resize( eogs.size() , s.nsamples() );
      for (int i=0;i<eogs.size();i++)
	{
	  ref.labels.push_back( s.labels[ eogs[i] ] );
	  ref.types.push_back( EOG );
	  ref.data.row(i) = s.data.row( eogs[i] );

	  std::vector<double> x = s.row( eogs[i] );
	  if ( MiscMath::sdev( x ) == 0 ) 
	    throw detection_failure_error( "EOG channel " + s.labels[ eogs[i] ] + " has zero variance" );
	}

      filter_spec_t band( opt.lwr , opt.upr );
      src = dsptools::apply_fir( src , band );
      ref = dsptools::apply_fir( ref , band );

      if ( src.nsamples() != ref.nsamples() )
	throw detection_failure_error( "sample count mismatch between sources and EOG" );

      //
      // score each reference
      //

      std::set<int> flagged;
      
      for (int e=0;e<ref.nchans();e++)
	{
	  
	  std::vector<double> y = ref.row( e );
	  std::vector<double> r( m.nc );
	  
	  for (int i=0;i<m.nc;i++)
	    {
	      std::vector<double> x = src.row( i );
	      if ( ! Statistics::correlation( x , y , &r[i] ) ) 
		throw detection_failure_error( "could not correlate IC" + Helper::int2str( i+1 ) 
					       + " with " + ref.labels[e] );
	      if ( ! Helper::realnum( r[i] ) ) 
		throw detection_failure_error( "non-finite score for IC" + Helper::int2str( i+1 ) );
	    }

	  std::vector<double> z;
	  std::set<int> f = flag_components( r , opt , &z );
	  
	  flagged.insert( f.begin() , f.end() );
	  
	  res.scores.push_back( r );
	  res.z.push_back( z );
	}

      res.indices.assign( flagged.begin() , flagged.end() );
      res.status = EOG_DETECTED;
      
    }
  catch ( eegprep_error & e )
    {
      res.status = EOG_FAILED;
      res.reason = e.what();
    }

  if ( res.status == EOG_FAILED )
    {
      res.indices.clear();
      logger.warning( "EOG detection failed (" + res.reason + "), no ICs excluded" );
      return res;
    }

  if ( res.indices.size() == 0 ) 
    logger << "  no ICs matched EOG\n";
  else
    {
      logger << "  EOG-related ICs:";
      for (int i=0;i<res.indices.size();i++) logger << " " << res.indices[i] + 1;
      logger << "\n";
    }
  
  return res;
}

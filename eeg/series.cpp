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

#include "eeg/series.h"

#include "helper/helper.h"

#include <set>

std::string eegprep::format_label( format_t f )
{
  if ( f == FORMAT_FIF ) return "FIF";
  return "EDF";
}

int eegprep::series_t::channel( const std::string & label ) const
{
  for (int s=0;s<labels.size();s++)
    if ( labels[s] == label ) return s;
  return -1;
}

std::vector<int> eegprep::series_t::channels( channel_type_t t ) const
{
  std::vector<int> r;
  for (int s=0;s<types.size();s++)
    if ( types[s] == t ) r.push_back( s );
  return r;
}

std::vector<double> eegprep::series_t::row( const int ch ) const
{
  if ( ch < 0 || ch >= nchans() ) 
    Helper::halt( "bad channel slot " + Helper::int2str( ch ) );
  const int n = nsamples();
  std::vector<double> r( n );
  for (int i=0;i<n;i++) r[i] = data(ch,i);
  return r;
}

eegprep::series_t eegprep::series_t::slice( const int start , const int n ) const
{
  if ( start < 0 || n < 0 || start + n > nsamples() )
    Helper::halt( "bad slice [" + Helper::int2str( start ) + "," + Helper::int2str( start + n ) + ")" );

  series_t s;
  s.labels = labels;
  s.types = types;
  s.sr = sr;
  s.data = data.block( 0 , start , nchans() , n );
  return s;
}

void eegprep::series_t::validate() const
{
  if ( ! ( sr > 0 ) ) 
    Helper::halt( "sample rate must be positive" );

  if ( labels.size() != data.rows() || types.size() != data.rows() )
    Helper::halt( "channel labels/types do not match data rows" );

  std::set<std::string> seen;
  for (int s=0;s<labels.size();s++)
    {
      if ( seen.find( labels[s] ) != seen.end() )
	Helper::halt( "duplicate channel label " + labels[s] );
      seen.insert( labels[s] );
    }
}

void eegprep::series_t::set_type( const std::vector<std::string> & chs , channel_type_t t )
{
  for (int i=0;i<chs.size();i++)
    {
      // case-insensitive
      int slot = -1;
      for (int s=0;s<labels.size();s++)
	if ( Helper::iequals( labels[s] , chs[i] ) ) { slot = s; break; }
      if ( slot == -1 )
	Helper::halt( "could not find channel " + chs[i] );
      types[ slot ] = t;
    }
}

eegprep::series_t eegprep::epoched_t::mean() const
{
  if ( epochs.size() == 0 )
    Helper::halt( "no epochs to average" );

  series_t m;
  m.labels = epochs[0].labels;
  m.types = epochs[0].types;
  m.sr = epochs[0].sr;
  m.data = Eigen::MatrixXd::Zero( epochs[0].nchans() , window );

  for (int e=0;e<epochs.size();e++)
    m.data += epochs[e].data;

  m.data /= (double)epochs.size();
  return m;
}

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

#include "ica/ica-apply.h"

#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;

eegprep::series_t eegprep::apply_ica( const series_t & s , const ica_model_t & m , const std::set<int> & excludes )
{
  
  series_t r = s;

  std::set<int>::const_iterator ee = excludes.begin();
  while ( ee != excludes.end() )
    {
      if ( *ee < 0 || *ee >= m.nc )
	Helper::halt( "cannot exclude IC " + Helper::int2str( *ee + 1 ) 
		      + ", model has " + Helper::int2str( m.nc ) + " components" );
      ++ee;
    }
  
  if ( excludes.size() == 0 ) 
    {
      logger << "  no ICs to remove, signals unchanged\n";
      return r;
    }

  const int ne = excludes.size();
  std::vector<int> e( excludes.begin() , excludes.end() );
  
  // S = W ( X - mu ), over the excluded rows only
  Eigen::MatrixXd X = m.fitted_data( s );
  X.colwise() -= m.means;

  Eigen::MatrixXd We( ne , m.unmixing.cols() );
  Eigen::MatrixXd Ae( m.mixing.rows() , ne );
  for (int i=0;i<ne;i++)
    {
      We.row(i) = m.unmixing.row( e[i] );
      Ae.col(i) = m.mixing.col( e[i] );
    }
  
  // X_clean = X - A[,E] S[E,]
  Eigen::MatrixXd D = Ae * ( We * X );
  
  for (int i=0;i<m.labels.size();i++)
    {
      const int slot = r.channel( m.labels[i] );
      r.data.row( slot ) -= D.row( i );
    }
  
  logger << "  removed " << ne << " IC(s) from " << m.labels.size() << " channels\n";
  
  return r;
}

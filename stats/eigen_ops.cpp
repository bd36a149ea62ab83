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

#include "stats/eigen_ops.h"
#include "miscmath/crandom.h"

#include <cmath>
#include <limits>

void eigen_ops::random_normal( Eigen::MatrixXd & M , CRandom & rng )
{
  const int rows = M.rows();
  const int cols = M.cols();
  for (int r = 0 ; r < rows ; r++ )
    for (int c = 0 ; c < cols ; c++)
      M(r,c) = rng.rnorm();
}

Eigen::VectorXd eigen_ops::row_means( const Eigen::MatrixXd & M )
{
  return M.rowwise().mean();
}

int eigen_ops::rank( const Eigen::VectorXd & d , const int n )
{
  if ( d.size() == 0 ) return 0;
  const double dmax = d.maxCoeff();
  if ( dmax <= 0 ) return 0;
  // singular values below this count as zero
  const double tol = dmax * n * std::numeric_limits<double>::epsilon() * 1e3;
  int r = 0;
  for (int i=0;i<d.size();i++)
    if ( d[i] > tol ) ++r;
  return r;
}

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

#ifndef __EEGPREP_EIGEN_OPS_H__
#define __EEGPREP_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <vector>

class CRandom;

namespace eigen_ops { 

  // fill with N(0,1) deviates drawn from the given generator
  void random_normal( Eigen::MatrixXd & m , CRandom & rng );  
  
  // row means (i.e. per channel of a channels x samples matrix)
  Eigen::VectorXd row_means( const Eigen::MatrixXd & m );
  
  // numerical rank from singular values (relative to the largest)
  int rank( const Eigen::VectorXd & singular_values , const int n );
  
}

#endif

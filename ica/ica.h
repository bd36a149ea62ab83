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

#ifndef __EEGPREP_ICA_H__
#define __EEGPREP_ICA_H__

#include <Eigen/Dense>

#include <vector>
#include <string>

#include "eeg/series.h"
#include "miscmath/crandom.h"

// C/C++ & Eigen implementation of the fastICA R package
// https://cran.r-project.org/web/packages/fastICA/

struct eigen_ica_t {
  
  eigen_ica_t( const int maxit_ , const double tol_ , const long unsigned seed )
  : maxit( maxit_ ) , tol( tol_ ) , alpha( 1.0 ) , rng( seed )
  {
    iterations = 0;
    converged = false;
  }
  
  // X is variables x observations (channels x samples), rows centered;
  // returns the number of components actually fitted
  int fit( const Eigen::MatrixXd & X , int nc );
  
  Eigen::MatrixXd K;  // whitening    nc x p
  Eigen::MatrixXd W;  // unmixing     nc x p  (a %*% K)
  Eigen::MatrixXd A;  // mixing       p  x nc

  int    maxit;
  double tol;
  double alpha;

  int    iterations;
  bool   converged;
  double lim;
  
 private:

  CRandom rng;

  Eigen::MatrixXd ica_parallel( const Eigen::MatrixXd & X , const int nc );

  // W <- (W W')^-1/2 W
  static Eigen::MatrixXd decorrelate( const Eigen::MatrixXd & W );
  
};


namespace eegprep {

  struct ica_options_t
  {
    ica_options_t() : nc( 15 ) , seed( 97 ) , maxit( -1 ) , tol( 1e-4 ) { } 

    // requested components
    int nc;

    long unsigned seed;

    // <= 0 means 'auto'
    int maxit;

    double tol;

    int iteration_bound() const { return maxit > 0 ? maxit : 1000 ; } 
  };
  
  
  //
  // a fitted decomposition; not changed after fit_ica()
  //
  
  struct ica_model_t
  {

    ica_model_t() : nc_req( 0 ) , nc( 0 ) , seed( 0 ) , maxit( 0 ) , iterations( 0 ) , converged( false ) { } 
    
    int nc_req;
    
    // effective count: min( nc_req , fitted channels , rank )
    int nc;

    long unsigned seed;
    
    // slots (in the series the model was fitted on) and labels of the
    // decomposed channels
    std::vector<int> chs;
    std::vector<std::string> labels;

    // per-channel means removed before fitting
    Eigen::VectorXd means;
    
    // nc x chs
    Eigen::MatrixXd unmixing;

    // chs x nc
    Eigen::MatrixXd mixing;
    
    int maxit;
    int iterations;
    bool converged;

    // source time courses (nc x samples) for a series with the same
    // channel labels as the fitted one
    Eigen::MatrixXd sources( const series_t & s ) const;

    // the fitted-channel rows of s, in model order (chs x samples)
    Eigen::MatrixXd fitted_data( const series_t & s ) const;
    
  };
  
  // decomposes every channel that is not EOG or STIM
  ica_model_t fit_ica( const series_t & s , const ica_options_t & opt );
  
}

#endif

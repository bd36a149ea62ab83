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

#include "ica/ica.h"

#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

extern logger_t logger;


int eigen_ica_t::fit( const Eigen::MatrixXd & X , int nc )
{

  // X   p x n  (channels x samples, centered)
  // K   nc x p
  // W   nc x p
  // A   p x nc
  
  // fun = logcosh, alpha = 1, row.norm = F

  const int p = X.rows();
  const int n = X.cols();

  if ( p < 2 || n < 2 ) 
    Helper::halt( "ICA requires at least two channels and two samples" );

  const int minnp = n < p ? n : p;

  if ( nc > minnp )
    {
      logger.warning( "nc is too large, resetting to " + Helper::int2str( minnp ) );
      nc = minnp;
    }

  //
  // Whitening
  //

  // V <- X %*% t(X)/n
  Eigen::MatrixXd V = X * ( X.array() / n ).matrix().transpose();

  // s <- La.svd(V)
  Eigen::BDCSVD<Eigen::MatrixXd> s( V , Eigen::ComputeThinU | Eigen::ComputeThinV );

  // components cannot exceed the rank of the covariance
  const int r = eigen_ops::rank( s.singularValues() , p );
  if ( r < 1 ) Helper::halt( "ICA input has zero variance" );
  if ( nc > r )
    {
      logger.warning( "channel covariance has rank " + Helper::int2str( r ) 
		      + ", fitting " + Helper::int2str( r ) + " components" );
      nc = r;
    }
  
  // D <- diag(c(1/sqrt(s$d)))
  Eigen::VectorXd d = s.singularValues().head( nc ).array().sqrt().inverse().matrix();
  
  // K <- D %*% t(s$u), first n.comp rows
  K = d.asDiagonal() * s.matrixU().leftCols( nc ).transpose();
      
  // X1 <- K %*% X
  Eigen::MatrixXd X1 = K * X;
  
  //
  // parallel method
  //
  
  Eigen::MatrixXd a = ica_parallel( X1 , nc );
  
  // w <- a %*% K
  W = a * K;
  
  // A <- t(w) %*% solve(w %*% t(w))
  A = W.transpose() * ( W * W.transpose() ).inverse();

  return nc;
}



Eigen::MatrixXd eigen_ica_t::decorrelate( const Eigen::MatrixXd & W )
{
  // W <- sW$u %*% Diag(1/sW$d) %*% t(sW$u) %*% W
  Eigen::BDCSVD<Eigen::MatrixXd> sW( W , Eigen::ComputeThinU | Eigen::ComputeThinV );
  return sW.matrixU() * ( sW.singularValues().array().inverse() ).matrix().asDiagonal() * sW.matrixU().transpose() * W;
}


//
// ICA PAR
//

Eigen::MatrixXd eigen_ica_t::ica_parallel( const Eigen::MatrixXd & X , const int nc )
{
  
  const int p = X.cols();
  
  //
  // initialize W with random normal values
  //
  
  Eigen::MatrixXd W( nc , nc );

  eigen_ops::random_normal( W , rng );

  W = decorrelate( W );
  
  Eigen::MatrixXd W1 = W;

  lim = 1000;

  iterations = 0;
  
  if ( globals::verbose )
    logger << "  starting iterations (symmetric FastICA using logcosh approx. to neg-entropy function)";
  
  while ( lim > tol && iterations < maxit )
    {

      //  wx <- W %*% X
      // gwx <- tanh(alpha * wx)
      Eigen::MatrixXd gwx = ( alpha * ( W * X ).array() ).tanh().matrix();

      // v1 <- gwx %*% t(X)/p
      Eigen::MatrixXd v1 = gwx * ( X.array() / p ).matrix().transpose(); 
      
      // g.wx <- alpha * (1 - (gwx)^2)
      gwx = alpha * ( 1 - gwx.array().square() ); 

      // v2 <- Diag(apply(g.wx, 1, FUN = mean)) %*% W
      Eigen::MatrixXd v2 = gwx.array().rowwise().mean().matrix().asDiagonal() * W;
            
      W1 = decorrelate( v1 - v2 );
      
      // lim <- max( Mod( Mod( diag(W1 %*% t(W) ) ) - 1 ) )
      lim = ( ( W1 * W.transpose() ).diagonal().array().abs() - 1 ).abs().maxCoeff();

      W = W1;

      if ( globals::verbose )
	{
	  if ( iterations % 50 == 0 ) logger << "\n ";
	  if ( iterations % 10 == 0 ) logger << " ";
	  logger << ".";
	}
      
      ++iterations;
    }

  if ( globals::verbose ) logger << "\n";
  
  converged = ! ( lim > tol );
  
  return W;

}


//
// model
//

Eigen::MatrixXd eegprep::ica_model_t::fitted_data( const series_t & s ) const
{
  Eigen::MatrixXd X( chs.size() , s.nsamples() );
  for (int i=0;i<labels.size();i++)
    {
      const int slot = s.channel( labels[i] );
      if ( slot == -1 ) 
	Helper::halt( "channel " + labels[i] + " not present, cannot project through ICA" );
      X.row(i) = s.data.row( slot );
    }
  return X;
}

Eigen::MatrixXd eegprep::ica_model_t::sources( const series_t & s ) const
{
  Eigen::MatrixXd X = fitted_data( s );
  X.colwise() -= means;
  return unmixing * X;
}


eegprep::ica_model_t eegprep::fit_ica( const series_t & s , const ica_options_t & opt )
{

  if ( opt.nc < 1 ) Helper::halt( "nc must be a positive integer" );
  if ( ! ( opt.tol > 0 ) ) Helper::halt( "tol must be positive" );
  
  ica_model_t m;
  m.nc_req = opt.nc;
  m.seed = opt.seed;
  m.maxit = opt.iteration_bound();
  
  //
  // channels to decompose
  //
  
  for (int c=0;c<s.nchans();c++)
    {
      if ( s.types[c] == EOG || s.types[c] == STIM ) continue;
      m.chs.push_back( c );
      m.labels.push_back( s.labels[c] );
    }

  if ( m.chs.size() == 0 ) 
    Helper::halt( "no channels to decompose (all are EOG or STIM)" );
  
  Eigen::MatrixXd X = m.fitted_data( s );
  
  m.means = eigen_ops::row_means( X );
  X.colwise() -= m.means;
  
  const int nc = m.nc_req < (int)m.chs.size() ? m.nc_req : m.chs.size(); 

  logger << "  fitting ICA: " << nc << " components from " 
	 << m.chs.size() << " channels x " << s.nsamples() << " samples (seed " << m.seed << ")\n";
  
  eigen_ica_t ica( m.maxit , opt.tol , m.seed );

  m.nc = ica.fit( X , nc );
  
  m.unmixing = ica.W;
  m.mixing = ica.A;
  m.iterations = ica.iterations;
  m.converged = ica.converged;
  
  if ( ! m.converged ) 
    throw eegprep::nonconvergence_error( "FastICA did not converge in " + Helper::int2str( m.maxit ) 
					 + " iterations (tolerance " + Helper::dbl2str( opt.tol ) 
					 + ", last change " + Helper::dbl2str( ica.lim ) + ")" );
  
  logger << "  converged after " << m.iterations << " iterations\n";
  
  return m;
}

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

#ifndef __EEGPREP_PLOTS_H__
#define __EEGPREP_PLOTS_H__

#include <string>
#include <vector>

#include "eeg/series.h"
#include "ica/ica.h"

struct rgb_t
{  
  rgb_t() { r=0;g=0;b=0; }
  rgb_t(double r,double g,double b) : r(r) , g(g) , b(b) { } 
  double r,g,b;  

  // #rrggbb
  std::string hex() const;
  
  // i-th color of a fixed qualitative palette (cycles)
  static rgb_t palette( int i );
};


// a single HTML page holding one line chart (inline SVG, with a small
// script for hover readout and legend toggling; no external resources)

struct html_plot_t
{

  html_plot_t( const std::string & title , const std::string & xlab , const std::string & ylab )
  : title( title ) , xlab( xlab ) , ylab( ylab ) , width( 900 ) , height( 400 ) , max_points( 5000 ) { } 
  
  struct trace_t 
  {
    std::string name;
    std::vector<double> x;
    std::vector<double> y;
    // added to y for display; readout shows y
    double offset;
  };
  
  std::string title;
  std::string xlab;
  std::string ylab;

  int width;
  int height;

  // longer traces are drawn every k-th point
  int max_points;
  
  std::vector<trace_t> traces;

  void add( const std::string & name , const std::vector<double> & x , const std::vector<double> & y , double offset );

  // throws io_failure_error
  void write( const std::string & filename ) const;

  static std::string escape( const std::string & s );

  static int decimation( const int n , const int max_points );
  
};


namespace eegprep {

  // first 5 channels, first 10 seconds, 100 units apart (voltages in uV)
  void render_raw( const series_t & s , const std::string & filename );
  
  void render_cleaned( const series_t & s , const std::string & filename );

  // first 10 sources of s under m, 200 units apart, by sample index
  void render_components( const ica_model_t & m , const series_t & s , const std::string & filename );

}

#endif

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

#include "graphics/plots.h"

#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <cmath>

extern logger_t logger;


//
// colors
//

std::string rgb_t::hex() const
{
  std::stringstream ss;
  ss << "#" << std::hex << std::setfill('0');
  ss << std::setw(2) << (int)floor( r * 255 + 0.5 )
     << std::setw(2) << (int)floor( g * 255 + 0.5 )
     << std::setw(2) << (int)floor( b * 255 + 0.5 );
  return ss.str();
}

rgb_t rgb_t::palette( int i )
{
  static const double pal[10][3] = { 
    { 0.122 , 0.467 , 0.706 } ,
    { 1.000 , 0.498 , 0.055 } ,
    { 0.173 , 0.627 , 0.173 } ,
    { 0.839 , 0.153 , 0.157 } ,
    { 0.580 , 0.404 , 0.741 } ,
    { 0.549 , 0.337 , 0.294 } ,
    { 0.890 , 0.467 , 0.761 } ,
    { 0.498 , 0.498 , 0.498 } ,
    { 0.737 , 0.741 , 0.133 } ,
    { 0.090 , 0.745 , 0.812 } };
  if ( i < 0 ) i = -i;
  i = i % 10;
  return rgb_t( pal[i][0] , pal[i][1] , pal[i][2] );
}


//
// html_plot_t
//

std::string html_plot_t::escape( const std::string & s )
{
  std::string out;
  out.reserve( s.size() );
  for (int i=0;i<s.size();i++)
    {
      const char c = s[i];
      if      ( c == '&' ) out += "&amp;";
      else if ( c == '<' ) out += "&lt;";
      else if ( c == '>' ) out += "&gt;";
      else if ( c == '"' ) out += "&quot;";
      else if ( c == '\'' ) out += "&#39;";
      else out.push_back( c );
    }
  return out;
}

int html_plot_t::decimation( const int n , const int max_points )
{
  if ( max_points < 1 || n <= max_points ) return 1;
  return (int)ceil( n / (double)max_points );
}

void html_plot_t::add( const std::string & name , const std::vector<double> & x , const std::vector<double> & y , double offset )
{
  if ( x.size() != y.size() ) 
    Helper::halt( "internal error: x/y length mismatch for trace " + name );
  trace_t t;
  t.name = name;
  t.x = x;
  t.y = y;
  t.offset = offset;
  traces.push_back( t );
}


void html_plot_t::write( const std::string & filename ) const
{
  
  if ( traces.size() == 0 ) 
    Helper::halt( "nothing to plot for " + filename );

  //
  // frame
  //
  
  const int ml = 70 , mr = 130 , mt = 40 , mb = 50;
  const int pw = width - ml - mr;
  const int ph = height - mt - mb;
  
  double xmin = 0 , xmax = 0 , ymin = 0 , ymax = 0;
  bool first = true;
  for (int t=0;t<traces.size();t++)
    for (int i=0;i<traces[t].x.size();i++)
      {
	const double x = traces[t].x[i];
	const double y = traces[t].y[i] + traces[t].offset;
	if ( ! ( Helper::realnum( x ) && Helper::realnum( y ) ) ) continue;
	if ( first ) { xmin = xmax = x; ymin = ymax = y; first = false; continue; }
	if ( x < xmin ) xmin = x;
	if ( x > xmax ) xmax = x;
	if ( y < ymin ) ymin = y;
	if ( y > ymax ) ymax = y;
      }
  
  if ( xmax <= xmin ) xmax = xmin + 1;
  if ( ymax <= ymin ) { ymin -= 1; ymax += 1; } 
  const double pad = 0.05 * ( ymax - ymin );
  ymin -= pad;
  ymax += pad;

  std::ofstream O1( filename.c_str() , std::ios::out );
  if ( ! O1.good() ) 
    throw eegprep::io_failure_error( "could not open " + filename + " for writing" );
  
  O1 << "<!DOCTYPE html>\n"
     << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
     << "<title>" << escape( title ) << "</title>\n"
     << "<style>\n"
     << "body { font-family: sans-serif; margin: 10px; }\n"
     << ".leg { cursor: pointer; }\n"
     << ".leg.off { opacity: 0.3; }\n"
     << "#readout { font-size: 12px; color: #333; min-height: 1.4em; white-space: pre; }\n"
     << "</style>\n</head>\n<body>\n";

  O1 << "<svg id=\"plot\" xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" "
     << "width=\"" << width << "\" height=\"" << height << "\" "
     << "viewBox=\"0 0 " << width << " " << height << "\">\n";

  O1 << "<rect x=\"0\" y=\"0\" width=\"" << width << "\" height=\"" << height << "\" fill=\"white\"/>\n";
  O1 << "<rect x=\"" << ml << "\" y=\"" << mt << "\" width=\"" << pw << "\" height=\"" << ph 
     << "\" fill=\"#f8f8fb\" stroke=\"#cccccc\"/>\n";

  //
  // axes: five ticks each
  //

  O1 << std::fixed << std::setprecision( 2 );
  
  O1 << "<g font-size=\"11\" fill=\"#333\" stroke=\"none\">\n";
  for (int k=0;k<=4;k++)
    {
      const double fx = k / 4.0;
      const double px = ml + fx * pw;
      const double py = mt + ph - fx * ph;
      O1 << "<line x1=\"" << px << "\" y1=\"" << mt << "\" x2=\"" << px << "\" y2=\"" << mt + ph << "\" stroke=\"#e6e6e6\"/>\n";
      O1 << "<line x1=\"" << ml << "\" y1=\"" << py << "\" x2=\"" << ml + pw << "\" y2=\"" << py << "\" stroke=\"#e6e6e6\"/>\n";
      O1 << "<text x=\"" << px << "\" y=\"" << mt + ph + 16 << "\" text-anchor=\"middle\">" 
	 << Helper::dbl2str( xmin + fx * ( xmax - xmin ) , 2 ) << "</text>\n";
      O1 << "<text x=\"" << ml - 6 << "\" y=\"" << py + 4 << "\" text-anchor=\"end\">" 
	 << Helper::dbl2str( ymin + fx * ( ymax - ymin ) , 1 ) << "</text>\n";
    }
  O1 << "<text x=\"" << ml + pw / 2 << "\" y=\"" << height - 10 << "\" text-anchor=\"middle\">" << escape( xlab ) << "</text>\n";
  O1 << "<text x=\"14\" y=\"" << mt + ph / 2 << "\" text-anchor=\"middle\" transform=\"rotate(-90 14 " 
     << mt + ph / 2 << ")\">" << escape( ylab ) << "</text>\n";
  O1 << "<text x=\"" << ml << "\" y=\"24\" font-size=\"16\">" << escape( title ) << "</text>\n";
  O1 << "</g>\n";

  //
  // traces
  //

  std::vector<int> steps( traces.size() );

  O1 << "<g fill=\"none\" stroke-width=\"1\">\n";
  for (int t=0;t<traces.size();t++)
    {
      const trace_t & tr = traces[t];
      const int step = decimation( tr.x.size() , max_points );
      steps[t] = step;
      O1 << "<polyline id=\"tr" << t << "\" stroke=\"" << rgb_t::palette( t ).hex() << "\" points=\"";
      bool first = true;
      for (int i=0;i<tr.x.size();i+=step)
	{
	  const double px = ml + ( tr.x[i] - xmin ) / ( xmax - xmin ) * pw;
	  const double py = mt + ph - ( tr.y[i] + tr.offset - ymin ) / ( ymax - ymin ) * ph;
	  if ( ! ( Helper::realnum( px ) && Helper::realnum( py ) ) ) continue;
	  if ( ! first ) O1 << ' ';
	  O1 << px << ',' << py;
	  first = false;
	}
      O1 << "\"/>\n";
    }
  O1 << "</g>\n";

  // hover guide
  O1 << "<line id=\"guide\" x1=\"0\" y1=\"" << mt << "\" x2=\"0\" y2=\"" << mt + ph 
     << "\" stroke=\"#999\" stroke-dasharray=\"3,3\" visibility=\"hidden\"/>\n";
  
  //
  // legend
  //

  O1 << "<g font-size=\"12\">\n";
  for (int t=0;t<traces.size();t++)
    {
      const int ly = mt + 10 + t * 18;
      O1 << "<g class=\"leg\" id=\"leg" << t << "\" onclick=\"toggle(" << t << ")\">"
	 << "<line x1=\"" << ml + pw + 10 << "\" y1=\"" << ly << "\" x2=\"" << ml + pw + 30 << "\" y2=\"" << ly 
	 << "\" stroke=\"" << rgb_t::palette( t ).hex() << "\" stroke-width=\"2\"/>"
	 << "<text x=\"" << ml + pw + 36 << "\" y=\"" << ly + 4 << "\">" << escape( traces[t].name ) << "</text></g>\n";
    }
  O1 << "</g>\n";
  
  O1 << "</svg>\n";
  O1 << "<div id=\"readout\"></div>\n";

  //
  // data for the readout (decimated as drawn)
  //

  O1 << "<script>\n";
  O1 << "var F = { l: " << ml << ", w: " << pw << ", x0: " << std::setprecision( 6 ) << std::defaultfloat << xmin 
     << ", x1: " << xmax << " };\n";
  O1 << "var T = [\n";
  for (int t=0;t<traces.size();t++)
    {
      const trace_t & tr = traces[t];
      O1 << " { name: \"" << escape( tr.name ) << "\", on: true, x: [";
      for (int i=0;i<tr.x.size();i+=steps[t]) O1 << ( i ? "," : "" ) << tr.x[i];
      O1 << "], y: [";
      for (int i=0;i<tr.y.size();i+=steps[t]) O1 << ( i ? "," : "" ) << tr.y[i];
      O1 << "] }" << ( t < traces.size() - 1 ? "," : "" ) << "\n";
    }
  O1 << "];\n";

  O1 << "function toggle(i) {\n"
     << "  T[i].on = !T[i].on;\n"
     << "  document.getElementById('tr' + i).style.display = T[i].on ? '' : 'none';\n"
     << "  document.getElementById('leg' + i).setAttribute('class', T[i].on ? 'leg' : 'leg off');\n"
     << "}\n"
     << "function nearest(a, v) {\n"
     << "  var lo = 0, hi = a.length - 1;\n"
     << "  while (hi - lo > 1) { var m = (lo + hi) >> 1; if (a[m] < v) lo = m; else hi = m; }\n"
     << "  return Math.abs(a[lo] - v) <= Math.abs(a[hi] - v) ? lo : hi;\n"
     << "}\n"
     << "var svg = document.getElementById('plot');\n"
     << "var guide = document.getElementById('guide');\n"
     << "var out = document.getElementById('readout');\n"
     << "svg.addEventListener('mousemove', function(ev) {\n"
     << "  var r = svg.getBoundingClientRect();\n"
     << "  var px = ev.clientX - r.left;\n"
     << "  if (px < F.l || px > F.l + F.w) { guide.setAttribute('visibility', 'hidden'); out.textContent = ''; return; }\n"
     << "  var xv = F.x0 + (px - F.l) / F.w * (F.x1 - F.x0);\n"
     << "  guide.setAttribute('x1', px); guide.setAttribute('x2', px);\n"
     << "  guide.setAttribute('visibility', 'visible');\n"
     << "  var s = '" << escape( xlab ) << ": ' + xv.toPrecision(6);\n"
     << "  for (var i = 0; i < T.length; i++) {\n"
     << "    if (!T[i].on || T[i].x.length == 0) continue;\n"
     << "    var k = nearest(T[i].x, xv);\n"
     << "    s += '   ' + T[i].name + ': ' + T[i].y[k].toPrecision(5);\n"
     << "  }\n"
     << "  out.textContent = s;\n"
     << "});\n"
     << "svg.addEventListener('mouseleave', function() { guide.setAttribute('visibility', 'hidden'); out.textContent = ''; });\n";
  O1 << "</script>\n</body>\n</html>\n";
  
  O1.close();
  if ( O1.fail() ) 
    throw eegprep::io_failure_error( "problem writing " + filename );
  
}



//
// renderers
//

// voltage channels are drawn in uV
static double display_scale( channel_type_t t )
{
  if ( t == EEG || t == EOG || t == ECG || t == EMG ) return 1e6;
  return 1;
}

static void render_signals( const eegprep::series_t & s , const std::string & title , const std::string & filename )
{
  
  html_plot_t plot( title , "Time (s)" , "Amplitude + offset" );
  
  const int nch = s.nchans() < 5 ? s.nchans() : 5;
  int np = (int)( 10 * s.sr );
  if ( np > s.nsamples() ) np = s.nsamples();

  std::vector<double> x( np );
  for (int i=0;i<np;i++) x[i] = i / s.sr;
  
  for (int c=0;c<nch;c++)
    {
      const double fac = display_scale( s.types[c] );
      std::vector<double> y( np );
      for (int i=0;i<np;i++) y[i] = s.data(c,i) * fac;
      plot.add( s.labels[c] , x , y , c * 100.0 );
    }
  
  plot.write( filename );
  
  logger << "  wrote " << nch << "-channel plot to " << filename << "\n";
}

void eegprep::render_raw( const series_t & s , const std::string & filename )
{
  render_signals( s , "Raw EEG Signal (first 5 channels, 10s)" , filename );
}

void eegprep::render_cleaned( const series_t & s , const std::string & filename )
{
  render_signals( s , "Cleaned EEG Signal (first 5 channels, 10s)" , filename );
}

void eegprep::render_components( const ica_model_t & m , const series_t & s , const std::string & filename )
{

  html_plot_t plot( "ICA Components (first 10)" , "Samples" , "Amplitude + offset" );

  Eigen::MatrixXd S = m.sources( s );
  
  const int nc = S.rows() < 10 ? S.rows() : 10;
  const int np = S.cols();
  
  std::vector<double> x( np );
  for (int i=0;i<np;i++) x[i] = i;
  
  for (int c=0;c<nc;c++)
    {
      std::vector<double> y( np );
      for (int i=0;i<np;i++) y[i] = S(c,i);
      plot.add( "ICA " + Helper::int2str( c+1 ) , x , y , c * 200.0 );
    }

  plot.write( filename );

  logger << "  wrote " << nc << "-component plot to " << filename << "\n";
}

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

#include "param.h"
#include "helper/helper.h"
#include "helper/errors.h"

#include <fstream>

static std::string unquote( const std::string & s )
{
  if ( s.size() > 1 )
    {
      const char q = s[0];
      if ( ( q == '"' || q == '\'' ) && s[ s.size() - 1 ] == q )
	return s.substr( 1 , s.size() - 2 );
    }
  return s;
}

void param_t::add( const std::string & option , const std::string & value ) 
{

  if ( option == "" ) return;
  
  // key+=value ","-appends to any existing list
  
  const bool append_mode = option[ option.size() - 1 ] == '+';

  if ( append_mode )
    {
      const std::string option1 = option.substr( 0 , option.size() - 1 );
      if ( option1 == "" ) return;
      if ( opt.find( option1 ) == opt.end() || opt[ option1 ] == "__null__" )
	opt[ option1 ] = value;
      else
	opt[ option1 ] = opt[ option1 ] + "," + value;
      return;
    }

  if ( opt.find( option ) != opt.end() ) 
    Helper::halt( option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value; 
  
}  

int param_t::size() const 
{ 
  return opt.size();
}

void param_t::parse( const std::string & s )
{
  // ignore subsequent '=' signs in 'value' (i.e. key=a=2 sets "a=2" to 'key')
  const std::string::size_type p = s.find( '=' );
  if ( p == std::string::npos ) 
    add( Helper::lrtrim( s ) , "__null__" );
  else
    add( Helper::lrtrim( s.substr( 0 , p ) ) , unquote( Helper::lrtrim( s.substr( p + 1 ) ) ) );
}

void param_t::read_file( const std::string & filename )
{

  if ( ! Helper::fileExists( filename ) )
    throw eegprep::io_failure_error( "could not open parameter file " + filename );
  
  std::ifstream IN1( filename.c_str() , std::ios::in );

  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      
      // comments
      const std::string::size_type c = line.find( '%' );
      if ( c != std::string::npos ) line = line.substr( 0 , c );

      line = Helper::lrtrim( line );
      if ( line == "" ) continue;

      // key=value, or key<tab/space>value 
      if ( line.find( '=' ) != std::string::npos )
	{
	  parse( line );
	  continue;
	}
      
      std::vector<std::string> tok = Helper::parse( line , " \t" );
      if ( tok.size() == 1 ) 
	add( tok[0] , "__null__" );
      else 
	{
	  std::string v = tok[1];
	  for (int i=2;i<tok.size();i++) v += " " + tok[i];
	  add( tok[0] , unquote( v ) );
	}
    }
  
  IN1.close();
}

bool param_t::has(const std::string & s ) const 
{
  return opt.find(s) != opt.end(); 
} 

bool param_t::empty(const std::string & s ) const
{
  if ( ! has( s ) ) return true; // no key
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno(const std::string & s , const bool default1 , const bool default2 ) const
{
  if ( ! has( s ) ) return default1;
  if ( empty( s ) ) return default2;
  return Helper::yesno( opt.find( s )->second ) ; 
}

std::string param_t::value( const std::string & s , const bool uppercase ) const 
{ 
  if ( ! has( s ) ) return "";
  const std::string & v = opt.find( s )->second;
  if ( v == "__null__" ) return "";
  return uppercase ? Helper::toupper( v ) : v;
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( empty(s) ) Helper::halt( "requires a value for parameter " + s );
  return value(s, uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  if ( empty(s) ) Helper::halt( "requires a value for parameter " + s );
  int r;
  if ( ! Helper::str2int( value(s) , &r ) ) 
    Helper::halt( "requires parameter " + s + " to have an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  if ( empty(s) ) Helper::halt( "requires a value for parameter " + s );
  double r;
  if ( ! Helper::str2dbl( value(s) , &r ) ) 
    Helper::halt( "requires parameter " + s + " to have a numeric value" );
  return r;
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::stringstream ss;
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() ) 
    {
      if ( ii != opt.begin() ) ss << delim;
      ss << indent << ii->first;
      if ( ii->second != "__null__" )
	ss << "=" << ii->second; 
      ++ii;
    }
  return ss.str();
}

std::vector<std::string> param_t::strvector( const std::string & k , const std::string delim , const bool uppercase ) const
{
  std::vector<std::string> s;
  if ( empty(k) ) return s;
  std::vector<std::string> tok = Helper::parse( value(k,uppercase) , delim );
  for (int i=0;i<tok.size();i++)
    s.push_back( unquote( Helper::lrtrim( tok[i] ) ) );
  return s;
}

void param_t::check( const std::set<std::string> & allowed ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      if ( allowed.find( ii->first ) == allowed.end() )
	Helper::halt( "unrecognized option: " + ii->first );
      ++ii;
    }
}

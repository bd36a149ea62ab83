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

#include "helper.h"
#include "errors.h"
#include "logger.h"

#include "defs/defs.h"

#include <cstdio>
#include <iomanip>
#include <fstream>
#include <streambuf>
#include <sys/stat.h>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::file_extension( const std::string & f )
{
  // ignore periods in folder names
  std::string::size_type slash = f.find_last_of( "/\\" );
  std::string::size_type dot = f.find_last_of( '.' );
  if ( dot == std::string::npos ) return "";
  if ( slash != std::string::npos && dot < slash ) return "";
  std::string e = f.substr( dot + 1 );
  for (int i=0;i<e.size();i++) e[i] = std::tolower( e[i] );
  return e;
}

std::string Helper::file_stem( const std::string & f )
{
  const std::string e = Helper::file_extension( f );
  if ( e == "" ) return f;
  return f.substr( 0 , f.size() - e.size() - 1 );
}

void Helper::halt( const std::string & msg )
{
  // the caller (i.e. main()) reports and sets the exit code
  throw eegprep::eegprep_error( msg );
}

bool Helper::realnum(double d)
{
  return std::isfinite( d );
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(uint64_t n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) ) 
    {
      fclose(file);
      return true;
    } 
  return false;
}

long Helper::file_size( const std::string & f )
{
  struct stat st;
  if ( stat( f.c_str() , &st ) != 0 ) return -1;
  return (long)st.st_size;
}

bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (tolower(a[i]) != tolower(b[i]))
      return false;
  return true;
}

bool Helper::imatch(const std::string& a, const std::string& b , unsigned int min )
{
  // i.e. "E" matches "EDF Annotations"
  if ( a == "" && b == "" ) return true;
  if ( a == "" || b == "" ) return false;
  
  unsigned int sz = a.size() < b.size() ? a.size() : b.size() ;
  if ( min != 0 ) sz = min;
  if ( a.size() < min || b.size() < min ) return false;

  for (unsigned int i = 0; i < sz; ++i)
    if (tolower(a[i]) != tolower(b[i]))
      return false;
  return true;
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE 
  // versus all else (including empty, i.e. 'epoch' --> 'epoch=T')
  if ( s.size() == 0 ) return true;
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

// split on any of the delimiters; empty slots become "." if requested

static std::vector<std::string> split_any( const std::string & s , const std::string & delims , bool empty )
{
  std::vector<std::string> strs;  
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {	        
      if ( delims.find( s[j] ) == std::string::npos ) continue;

      if ( j == p ) // empty slot?
	{
	  if ( empty ) strs.push_back( "." );
	  ++p;
	}
      else
	{
	  strs.push_back(s.substr(p,j-p)); 
	  p=j+1; 
	}
    }
  
  if ( empty && p == s.size() ) 
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );
  
  return strs;
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{
  return split_any( s , std::string( 1 , c ) , empty );
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{  
  return split_any( item , s , empty );
}
 

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  // sentry guards direct streambuf access
  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();
  
  for ( ; ; ) 
    {
      int c = sb->sbumpc();
      
      switch (c) 
	{
	case '\n':
	  return is;
	  
	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

 	case EOF :
 	  // last line may have no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;
	  
	default:
	  t += (char)c;
	}
    }
}

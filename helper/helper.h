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

#ifndef __EEGPREP_HELPER_H__
#define __EEGPREP_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm> 
#include <cctype>
#include <stdint.h>
#include <map>
#include <cmath>

namespace Helper 
{

  std::string toupper( const std::string & );  

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase( s.begin(), std::find_if( s.begin(), s.end(), [](int c) {return !std::isspace(c);}));
    return s;
  }
  
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase( std::find_if( s.rbegin(), s.rend(), [](int c) {return !std::isspace(c);}).base(), s.end() );
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  // everything after the last period (lower-cased), or empty
  std::string file_extension( const std::string & f );

  // path without its final extension
  std::string file_stem( const std::string & f );
  
  bool iequals(const std::string& a, const std::string& b);

  // case-insensitive match up to the shorter of the two
  bool imatch(const std::string& a, const std::string& b , unsigned int min = 0 );

  bool yesno( const std::string & s );
  
  bool fileExists(const std::string &);

  long file_size( const std::string & f );
  
  // throws eegprep_error
  void halt( const std::string & msg );

  bool realnum(double d);
  
  std::string int2str(int n);  
  std::string int2str(long n);
  std::string int2str(uint64_t n);
  std::string dbl2str(double n);  
  std::string dbl2str(double n, int dp);  

  template<typename T> 
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;
      
      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }
  
  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      return !(iss >> f >> t).fail();
    }

  bool str2dbl(const std::string & , double * ); 
  bool str2int(const std::string & , int * ); 

  std::vector<std::string> char_split( const std::string & s , const char c , bool empty = true );
  
  // split on any character in s
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );

  // read a single line (handles \r\n endings)
  std::istream& safe_getline(std::istream& is, std::string& t);
  
}

#endif

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

#ifndef __EEGPREP_PARAM_H__
#define __EEGPREP_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>
#include <sstream>

//
// key=value options, from the command line or a parameter file
//

struct param_t
{

 public:
  
  void add( const std::string & option , const std::string & value = "" ); 

  int size() const;
  
  // 'key', 'key=value' or 'key+=value'
  void parse( const std::string & s );

  // one 'key value' or 'key=value' per line, % comments
  void read_file( const std::string & filename );
  
  bool has(const std::string & s ) const;
  
  bool empty(const std::string & s ) const;
  
  // if ! has(X) return default1
  // if present without a value (i.e. not X=F or X=T), return default2
  bool yesno(const std::string & s , const bool default1 = false , const bool default2 = true ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;
  
  std::string requires( const std::string & s , const bool uppercase = false ) const;
  
  int requires_int( const std::string & s ) const;
  
  double requires_dbl( const std::string & s ) const;

  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string delim = "," , const bool uppercase = false ) const;
  
  // halt on any key not in the allowed set
  void check( const std::set<std::string> & allowed ) const;
  
private:

  std::map<std::string,std::string> opt;

};


#endif

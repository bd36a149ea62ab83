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

#ifndef __EEGPREP_MAIN_H__
#define __EEGPREP_MAIN_H__

#include <string>
#include <set>

struct param_t;

// misc helper: build params from the command line (key=value, @file)
void build_param( param_t * param , int argc , char** argv , int start );

// misc helper: all keys the command line accepts
std::set<std::string> cmdline_keys();

// misc helper: manage memory resource issues
void NoMem();

// misc helper: return eegprep version
std::string eegprep_version();

#endif

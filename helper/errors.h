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

#ifndef __EEGPREP_ERRORS_H__
#define __EEGPREP_ERRORS_H__

#include <stdexcept>
#include <string>

namespace eegprep {

  // base of all pipeline failures; Helper::halt() throws this
  
  struct eegprep_error : public std::runtime_error
  {
    explicit eegprep_error( const std::string & msg ) : std::runtime_error( msg ) { } 
  };

  // input extension outside the supported set: raised before the file is opened
  
  struct unsupported_format_error : public eegprep_error
  {
    explicit unsupported_format_error( const std::string & msg ) : eegprep_error( msg ) { }
  };

  // missing, unreadable, truncated or unwritable files
  
  struct io_failure_error : public eegprep_error
  {
    explicit io_failure_error( const std::string & msg ) : eegprep_error( msg ) { }
  };

  // FastICA did not meet its tolerance within the iteration bound
  
  struct nonconvergence_error : public eegprep_error
  {
    explicit nonconvergence_error( const std::string & msg ) : eegprep_error( msg ) { } 
  };

  // only thrown (and caught) inside the EOG detector
  
  struct detection_failure_error : public eegprep_error
  {
    explicit detection_failure_error( const std::string & msg ) : eegprep_error( msg ) { }
  };

}

#endif

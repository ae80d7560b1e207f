//
// AsmReport - Assembly Report Filter
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#include "Exceptions.hpp"

#include "boost/date_time.hpp"

#include <cstring>
#include <sstream>

namespace asmreport {
namespace common {

std::string ExceptionData::getContext() const
{
  std::ostringstream oss;
  oss << boost::posix_time::to_simple_string(boost::posix_time::second_clock::local_time());
  if (0 != _errorNumber) {
    oss << " '" << strerror(_errorNumber) << "'";
  }
  oss << " " << boost::diagnostic_information(*this);
  return oss.str();
}

}  // namespace common
}  // namespace asmreport

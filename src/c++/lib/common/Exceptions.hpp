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
/// \brief exception types for report loading and the FilterReport command line
///

#pragma once

#include "blt_util/thirdparty_push.h"

#include "boost/cerrno.hpp"
#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include "blt_util/thirdparty_pop.h"

#include <stdexcept>
#include <string>

namespace asmreport {
namespace common {

/// attach extra description to an exception while it propagates:
///
///     catch (GeneralException& e) { e << ExceptionMsg("while reading file 'x'"); throw; }
///
typedef boost::error_info<struct extra_exception_message, std::string> ExceptionMsg;

/// \brief message and errno data of a report exception, reported by Program::run
///
class ExceptionData : public boost::exception {
public:
  ExceptionData(const std::string& message, const int errorNumber = 0)
    : boost::exception(), _message(message), _errorNumber(errorNumber)
  {
  }

  ExceptionData(const ExceptionData&) = default;
  ExceptionData& operator=(const ExceptionData&) = delete;

  const std::string& getMessage() const { return _message; }

  /// time, errno description and boost diagnostic information in one string
  std::string getContext() const;

private:
  const std::string _message;
  const int         _errorNumber;
};

/// error type for any failure without a more specific exception type
///
///     BOOST_THROW_EXCEPTION(GeneralException("Error message"));
///
class GeneralException : public std::logic_error, public ExceptionData {
public:
  explicit GeneralException(const std::string& message, const int errorNumber = 0)
    : std::logic_error(message), ExceptionData(message, errorNumber)
  {
  }
};

/// Thrown when the report input violates the expected column layout or a
/// column value can't be converted to the column type
///
class ReportFormatException : public GeneralException {
public:
  explicit ReportFormatException(const std::string& message) : GeneralException(message, EINVAL) {}
};

}  // namespace common
}  // namespace asmreport

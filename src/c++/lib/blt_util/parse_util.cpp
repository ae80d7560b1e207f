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

#include "blt_util/parse_util.hpp"
#include "blt_util/blt_exception.hpp"

#include "blt_util/thirdparty_push.h"

#include "boost/spirit/include/qi.hpp"

#include "blt_util/thirdparty_pop.h"

#include <sstream>

namespace asmreport {
namespace blt_util {

/// parse all of s with the spirit numeric parser, throw if any part of s is left over
template <typename T, typename Parser>
static T parseCompleteString(const std::string& s, const Parser& parser, const char* typeLabel)
{
  T                                 val(0);
  std::string::const_iterator       iter(s.begin());
  const std::string::const_iterator iterEnd(s.end());
  const bool isPass(boost::spirit::qi::parse(iter, iterEnd, parser, val) && (iter == iterEnd));
  if (!isPass) {
    std::ostringstream oss;
    oss << "Can't parse " << typeLabel << " from string: '" << s << "'";
    throw blt_exception(oss.str().c_str());
  }
  return val;
}

int parse_int_str(const std::string& s)
{
  return parseCompleteString<int>(s, boost::spirit::qi::int_, "int");
}

long parse_long_str(const std::string& s)
{
  return parseCompleteString<long>(s, boost::spirit::qi::long_, "long int");
}

double parse_double_str(const std::string& s)
{
  return parseCompleteString<double>(s, boost::spirit::qi::double_, "double");
}

}  // namespace blt_util
}  // namespace asmreport

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

#include "report/ReportFlag.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

namespace REPORT_FLAG {

index_t get_index(const std::string& str)
{
  for (int i(0); i < SIZE; ++i) {
    if (str == label(static_cast<index_t>(i))) return static_cast<index_t>(i);
  }
  return SIZE;
}

}  // namespace REPORT_FLAG

REPORT_FLAG::index_t ReportFlag::getKnownIndex(const std::string& flagName)
{
  const REPORT_FLAG::index_t index(REPORT_FLAG::get_index(flagName));
  if (index == REPORT_FLAG::SIZE) {
    using namespace asmreport::common;
    std::ostringstream oss;
    oss << "Unknown report flag name: '" << flagName << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
  return index;
}

bool ReportFlag::has(const std::string& flagName) const
{
  return has(getKnownIndex(flagName));
}

void ReportFlag::add(const std::string& flagName)
{
  add(getKnownIndex(flagName));
}

std::vector<std::string> ReportFlag::getSetLabels() const
{
  std::vector<std::string> labels;
  for (int i(0); i < REPORT_FLAG::SIZE; ++i) {
    const REPORT_FLAG::index_t index(static_cast<REPORT_FLAG::index_t>(i));
    if (has(index)) labels.emplace_back(REPORT_FLAG::label(index));
  }
  return labels;
}

void ReportFlag::writeLongString(std::ostream& os) const
{
  for (int i(0); i < REPORT_FLAG::SIZE; ++i) {
    const REPORT_FLAG::index_t index(static_cast<REPORT_FLAG::index_t>(i));
    os << (has(index) ? "[X] " : "[ ] ") << REPORT_FLAG::label(index) << "\n";
  }
}

std::ostream& operator<<(std::ostream& os, const ReportFlag& flag)
{
  os << flag.value();
  return os;
}

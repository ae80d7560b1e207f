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

#include "report/ReportTsvWriter.hpp"

#include "common/OutStream.hpp"

#include <iostream>

void writeReportTsv(const ReportSet& reportSet, std::ostream& os)
{
  os << reportSet.getSchema().getHeaderLine() << "\n";

  for (const auto& refValue : reportSet) {
    for (const auto& contigValue : refValue.second) {
      for (const ReportRecord& record : contigValue.second) {
        os << record << "\n";
      }
    }
  }
}

void writeReportTsv(const ReportSet& reportSet, const std::string& filename)
{
  OutStream outs(filename);
  writeReportTsv(reportSet, outs.getStream());
  outs.close();
}

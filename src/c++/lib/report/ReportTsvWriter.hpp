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

#pragma once

#include "report/ReportSet.hpp"

#include <iosfwd>
#include <string>

/// \brief write reportSet in the tab-delimited report format
///
/// A '#'-prefixed header line is followed by one line per record, ordered by
/// reference name, then contig name, then input order within each group.
///
void writeReportTsv(const ReportSet& reportSet, std::ostream& os);

/// write tsv report to filename, or to stdout if filename is empty
void writeReportTsv(const ReportSet& reportSet, const std::string& filename);

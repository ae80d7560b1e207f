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
/// \brief Synthetic assembly report rows for unit testing
///

#pragma once

#include "report/ReportRecord.hpp"

#include <map>
#include <string>
#include <vector>

typedef std::map<std::string, std::string> column_values_t;

/// \brief Return a report line in the default schema
///
/// Every column is given a fixed value describing a well assembled contig with a
/// known variant, which passes the default filters. Values in \p columnValues
/// replace the defaults for the named columns.
std::string getTestReportLine(const column_values_t& columnValues = column_values_t());

/// \brief Return the parsed record of getTestReportLine(columnValues)
ReportRecord getTestReportRecord(const column_values_t& columnValues = column_values_t());

/// \brief Return a record for one reference/contig group
///
/// \param isEssential if false, the percent identity is set below the default minimum
/// \param hasKnownVariant value of the has_known_var column
/// \param label stored in the free_text column, which is not a variant column, to identify the record
ReportRecord getTestGroupRecord(
    const std::string& refName,
    const std::string& contigName,
    const bool         isEssential,
    const std::string& hasKnownVariant,
    const std::string& label);

/// \brief header line and records of the default schema, one record per line
std::string getTestReportText(const std::vector<ReportRecord>& records);

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
/// \brief Spreadsheet output of the report
///
/// The workbook is an XML Spreadsheet 2003 document, which spreadsheet
/// applications open directly when given the '.xls' extension.
///

#pragma once

#include "report/ReportSet.hpp"

#include <iosfwd>
#include <string>

/// name of the single worksheet in the workbook
extern const char reportWorksheetName[];

/// \brief write reportSet as a single-sheet workbook
///
/// The first row holds the column names, followed by one row per record in the
/// same order and with the same text as writeReportTsv(). All cells are
/// string-typed.
///
void writeReportWorkbook(const ReportSet& reportSet, std::ostream& os);

/// write workbook to filename, or to stdout if filename is empty
void writeReportWorkbook(const ReportSet& reportSet, const std::string& filename);

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

#include "report/ReportWorkbookWriter.hpp"

#include "common/OutStream.hpp"

#include "blt_util/thirdparty_push.h"

#include "boost/property_tree/ptree.hpp"
#include "boost/property_tree/xml_parser.hpp"

#include "blt_util/thirdparty_pop.h"

#include <iostream>
#include <string>
#include <vector>

const char reportWorksheetName[] = "ARIBA_report";

using boost::property_tree::ptree;

namespace {

const char spreadsheetNamespace[] = "urn:schemas-microsoft-com:office:spreadsheet";

/// XML 1.0 allows no C0 control characters other than tab, newline and carriage return
std::string getXmlCellText(const std::string& value)
{
  std::string text(value);
  for (char& c : text) {
    const unsigned char uc(static_cast<unsigned char>(c));
    if ((uc < 0x20) && (c != '\t') && (c != '\n') && (c != '\r')) c = ' ';
  }
  return text;
}

void addRow(const std::vector<std::string>& values, ptree& table)
{
  ptree row;
  for (const std::string& value : values) {
    ptree cell;
    cell.put("Data", getXmlCellText(value));
    cell.put("Data.<xmlattr>.ss:Type", "String");
    row.add_child("Cell", cell);
  }
  table.add_child("Row", row);
}

}  // namespace

void writeReportWorkbook(const ReportSet& reportSet, std::ostream& os)
{
  ptree table;
  addRow(reportSet.getSchema().getColumnNames(), table);

  for (const auto& refValue : reportSet) {
    for (const auto& contigValue : refValue.second) {
      for (const ReportRecord& record : contigValue.second) {
        addRow(record.getTexts(), table);
      }
    }
  }

  ptree worksheet;
  worksheet.put("<xmlattr>.ss:Name", reportWorksheetName);
  worksheet.add_child("Table", table);

  ptree workbook;
  workbook.put("<xmlattr>.xmlns", spreadsheetNamespace);
  workbook.put("<xmlattr>.xmlns:ss", spreadsheetNamespace);
  workbook.add_child("Worksheet", worksheet);

  ptree doc;
  doc.add_child("Workbook", workbook);

  boost::property_tree::xml_writer_settings<std::string> settings(' ', 1);
  boost::property_tree::write_xml(os, doc, settings);
}

void writeReportWorkbook(const ReportSet& reportSet, const std::string& filename)
{
  OutStream outs(filename);
  writeReportWorkbook(reportSet, outs.getStream());
  outs.close();
}

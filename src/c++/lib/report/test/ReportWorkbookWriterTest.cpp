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

#include "boost/test/unit_test.hpp"

#include "report/ReportWorkbookWriter.hpp"
#include "test/testFileMakers.hpp"
#include "test/testReportUtil.hpp"

#include "boost/property_tree/ptree.hpp"
#include "boost/property_tree/xml_parser.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(ReportWorkbookWriter_test_suite)

using boost::property_tree::ptree;

/// return the text of each cell of each row in the worksheet
static std::vector<std::vector<std::string>> readWorksheetRows(const ptree& doc)
{
  std::vector<std::vector<std::string>> rows;
  for (const ptree::value_type& rowValue : doc.get_child("Workbook.Worksheet.Table")) {
    if (rowValue.first != "Row") continue;
    std::vector<std::string> cells;
    for (const ptree::value_type& cellValue : rowValue.second) {
      if (cellValue.first != "Cell") continue;
      BOOST_REQUIRE_EQUAL(cellValue.second.get<std::string>("Data.<xmlattr>.ss:Type"), "String");
      cells.push_back(cellValue.second.get<std::string>("Data"));
    }
    rows.push_back(cells);
  }
  return rows;
}

BOOST_AUTO_TEST_CASE(test_WriteWorkbook)
{
  const ReportRecord r1(getTestGroupRecord("ref2", "ctg1", true, "1", "r1"));
  const ReportRecord r2(getTestGroupRecord("ref1", "ctg1", true, "0", "r2 & <r3>"));

  ReportSet reportSet;
  reportSet.addRecord(r1);
  reportSet.addRecord(r2.getDemoted(reportSet.getSchema()));

  std::ostringstream oss;
  writeReportWorkbook(reportSet, oss);

  std::istringstream iss(oss.str());
  ptree              doc;
  boost::property_tree::read_xml(iss, doc);

  BOOST_REQUIRE_EQUAL(doc.get<std::string>("Workbook.Worksheet.<xmlattr>.ss:Name"), reportWorksheetName);
  BOOST_REQUIRE_EQUAL(std::string(reportWorksheetName), "ARIBA_report");

  const std::vector<std::vector<std::string>> rows(readWorksheetRows(doc));
  BOOST_REQUIRE_EQUAL(rows.size(), 3u);
  BOOST_REQUIRE(rows[0] == reportSet.getSchema().getColumnNames());
  BOOST_REQUIRE(rows[1] == r2.getDemoted(reportSet.getSchema()).getTexts());
  BOOST_REQUIRE(rows[2] == r1.getTexts());
}

BOOST_AUTO_TEST_CASE(test_WriteWorkbookControlCharacters)
{
  ReportSet reportSet;
  reportSet.addRecord(getTestGroupRecord("ref1", "ctg1", true, "1", "a\x01b\x1b[0m"));

  std::ostringstream oss;
  writeReportWorkbook(reportSet, oss);
  BOOST_REQUIRE(oss.str().find('\x01') == std::string::npos);
  BOOST_REQUIRE(oss.str().find('\x1b') == std::string::npos);

  std::istringstream iss(oss.str());
  ptree              doc;
  boost::property_tree::read_xml(iss, doc);

  const std::vector<std::vector<std::string>> rows(readWorksheetRows(doc));
  BOOST_REQUIRE_EQUAL(rows.size(), 2u);

  const boost::optional<unsigned> freeTextIndex(reportSet.getSchema().getColumnIndex("free_text"));
  BOOST_REQUIRE(freeTextIndex);
  BOOST_REQUIRE_EQUAL(rows[1][*freeTextIndex], "a b [0m");
}

BOOST_AUTO_TEST_CASE(test_WriteWorkbookFile)
{
  ReportSet reportSet;
  reportSet.addRecord(getTestReportRecord());

  const TestFilenameMaker workbookFile;
  writeReportWorkbook(reportSet, workbookFile.getFilename());

  ptree doc;
  boost::property_tree::read_xml(workbookFile.getFilename(), doc);
  BOOST_REQUIRE_EQUAL(readWorksheetRows(doc).size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

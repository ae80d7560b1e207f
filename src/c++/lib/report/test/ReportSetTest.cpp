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

#include "common/Exceptions.hpp"
#include "report/ReportSet.hpp"
#include "report/ReportTsvWriter.hpp"
#include "test/testFileMakers.hpp"
#include "test/testReportUtil.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(ReportSet_test_suite)

using asmreport::common::GeneralException;
using asmreport::common::ReportFormatException;

static std::vector<ReportRecord> getMixedOrderRecords()
{
  return {getTestGroupRecord("ref2", "ctg1", true, "1", "a"),
          getTestGroupRecord("ref1", "ctg2", true, "1", "b"),
          getTestGroupRecord("ref2", "ctg1", true, "0", "c"),
          getTestGroupRecord("ref1", "ctg1", false, "1", "d"),
          getTestGroupRecord("ref1", "ctg2", true, "0", "e")};
}

BOOST_AUTO_TEST_CASE(test_LoadGroups)
{
  const std::vector<ReportRecord> records(getMixedOrderRecords());
  std::istringstream               iss(getTestReportText(records));

  ReportSet reportSet;
  reportSet.load(iss, "test");

  BOOST_REQUIRE_EQUAL(reportSet.size(), 2u);
  BOOST_REQUIRE_EQUAL(reportSet.groupCount(), 3u);
  BOOST_REQUIRE_EQUAL(reportSet.recordCount(), 5u);

  // references and contigs are ordered by name, records keep file order:
  auto refIter(reportSet.begin());
  BOOST_REQUIRE_EQUAL(refIter->first, "ref1");
  BOOST_REQUIRE_EQUAL(refIter->second.begin()->first, "ctg1");
  ++refIter;
  BOOST_REQUIRE_EQUAL(refIter->first, "ref2");

  const ReportSet::group_t& group(reportSet.getGroup("ref1", "ctg2"));
  BOOST_REQUIRE_EQUAL(group.size(), 2u);
  BOOST_REQUIRE_EQUAL(group[0], records[1]);
  BOOST_REQUIRE_EQUAL(group[1], records[4]);

  BOOST_REQUIRE(reportSet.hasGroup("ref2", "ctg1"));
  BOOST_REQUIRE(!reportSet.hasGroup("ref2", "ctg2"));
  BOOST_REQUIRE_THROW(reportSet.getGroup("ref3", "ctg1"), GeneralException);
}

BOOST_AUTO_TEST_CASE(test_LoadFile)
{
  const std::vector<ReportRecord> records(getMixedOrderRecords());
  const TestTextFileMaker          reportFile(getTestReportText(records));

  ReportSet reportSet;
  reportSet.load(reportFile.getFilename().c_str());
  BOOST_REQUIRE_EQUAL(reportSet.recordCount(), 5u);
}

BOOST_AUTO_TEST_CASE(test_LoadMissingFile)
{
  const TestFilenameMaker missingFile;

  ReportSet reportSet;
  BOOST_REQUIRE_THROW(reportSet.load(missingFile.getFilename().c_str()), std::exception);
}

BOOST_AUTO_TEST_CASE(test_LoadEmpty)
{
  std::istringstream iss("");

  ReportSet reportSet;
  reportSet.addRecord(getTestReportRecord());
  reportSet.load(iss, "empty");
  BOOST_REQUIRE(reportSet.empty());
}

BOOST_AUTO_TEST_CASE(test_LoadHeaderOnly)
{
  std::istringstream iss(ReportSchema::getDefault().getHeaderLine() + "\n");

  ReportSet reportSet;
  reportSet.load(iss, "header");
  BOOST_REQUIRE(reportSet.empty());
}

BOOST_AUTO_TEST_CASE(test_LoadCarriageReturn)
{
  const ReportRecord record(getTestReportRecord());
  std::istringstream iss(ReportSchema::getDefault().getHeaderLine() + "\r\n" + record.getLine() + "\r\n");

  ReportSet reportSet;
  reportSet.load(iss, "crlf");
  BOOST_REQUIRE_EQUAL(reportSet.recordCount(), 1u);
  BOOST_REQUIRE_EQUAL(reportSet.getGroup("ref1", "ctg1").front(), record);
}

BOOST_AUTO_TEST_CASE(test_LoadBadHeader)
{
  std::string header(ReportSchema::getDefault().getHeaderLine());
  header[0] = 'X';
  std::istringstream iss(header + "\n" + getTestReportLine() + "\n");

  ReportSet reportSet;
  BOOST_REQUIRE_THROW(reportSet.load(iss, "badHeader"), ReportFormatException);
  BOOST_REQUIRE(reportSet.empty());
}

BOOST_AUTO_TEST_CASE(test_LoadBadLine)
{
  // the failing line follows good lines, none of which may be kept:
  std::ostringstream oss;
  oss << getTestReportText(getMixedOrderRecords()) << getTestReportLine({{"pc_ident", "x"}}) << "\n";
  std::istringstream iss(oss.str());

  ReportSet reportSet;
  BOOST_REQUIRE_THROW(reportSet.load(iss, "badLine"), ReportFormatException);
  BOOST_REQUIRE(reportSet.empty());
}

BOOST_AUTO_TEST_CASE(test_LoadShortLine)
{
  std::istringstream iss(ReportSchema::getDefault().getHeaderLine() + "\nref1\tctg1\n");

  ReportSet reportSet;
  BOOST_REQUIRE_THROW(reportSet.load(iss, "shortLine"), ReportFormatException);
  BOOST_REQUIRE(reportSet.empty());
}

BOOST_AUTO_TEST_CASE(test_TsvRoundTrip)
{
  std::istringstream iss(getTestReportText(getMixedOrderRecords()));
  ReportSet          reportSet;
  reportSet.load(iss, "first");

  std::ostringstream oss;
  writeReportTsv(reportSet, oss);

  std::istringstream iss2(oss.str());
  ReportSet          reportSet2;
  reportSet2.load(iss2, "second");

  BOOST_REQUIRE(reportSet == reportSet2);
}

BOOST_AUTO_TEST_CASE(test_FilterGroups)
{
  std::istringstream iss(getTestReportText(getMixedOrderRecords()));
  ReportSet          reportSet;
  reportSet.load(iss, "test");

  // drop every record of ref1/ctg1 and ref2/ctg1, keep the first record of other groups:
  reportSet.filterGroups([](const ReportSet::group_t& group) {
    ReportSet::group_t result;
    if (group.front().getText(ReportSchema::getDefault().getContigNameColumn()) == "ctg2") {
      result.push_back(group.front());
    }
    return result;
  });

  BOOST_REQUIRE_EQUAL(reportSet.size(), 1u);
  BOOST_REQUIRE_EQUAL(reportSet.groupCount(), 1u);
  BOOST_REQUIRE_EQUAL(reportSet.recordCount(), 1u);
  BOOST_REQUIRE(!reportSet.hasGroup("ref1", "ctg1"));
  BOOST_REQUIRE(reportSet.hasGroup("ref1", "ctg2"));
}

BOOST_AUTO_TEST_SUITE_END()

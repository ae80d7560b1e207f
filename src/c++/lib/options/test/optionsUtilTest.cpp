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

#include "options/optionsUtil.hpp"
#include "test/testFileMakers.hpp"

#include "boost/filesystem.hpp"

BOOST_AUTO_TEST_SUITE(optionsUtil_test_suite)

BOOST_AUTO_TEST_CASE(test_RequiredInputFilePath)
{
  std::string errorMsg;

  std::string filename;
  BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(filename, "report", errorMsg));
  BOOST_REQUIRE(errorMsg.find("Must specify report") == 0);

  const TestFilenameMaker missingFile;
  filename = missingFile.getFilename();
  BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(filename, "report", errorMsg));
  BOOST_REQUIRE(errorMsg.find("Can't find report") == 0);

  filename = boost::filesystem::temp_directory_path().string();
  BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(filename, "report", errorMsg));

  const TestTextFileMaker reportFile("text\n");
  filename = reportFile.getFilename();
  BOOST_REQUIRE(!checkAndStandardizeRequiredInputFilePath(filename, "report", errorMsg));
  BOOST_REQUIRE_EQUAL(errorMsg, "");
  BOOST_REQUIRE(boost::filesystem::path(filename).is_absolute());
}

BOOST_AUTO_TEST_SUITE_END()

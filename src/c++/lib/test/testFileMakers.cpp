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

#include "testFileMakers.hpp"

#include "test/testUtil.hpp"

#include "boost/filesystem.hpp"

#include <fstream>

TestFileMakerBase::~TestFileMakerBase()
{
  using namespace boost::filesystem;
  if (exists(_tempFilename)) {
    remove(_tempFilename);
  }
}

TestFilenameMaker::TestFilenameMaker()
{
  _tempFilename = getNewTempFile();
}

TestOutputPrefixMaker::TestOutputPrefixMaker()
{
  _tempFilename = getNewTempFile();
}

TestOutputPrefixMaker::~TestOutputPrefixMaker()
{
  using namespace boost::filesystem;
  for (const std::string& filename : {getTsvFilename(), getWorkbookFilename()}) {
    if (exists(filename)) {
      remove(filename);
    }
  }
}

TestTextFileMaker::TestTextFileMaker(const std::string& text)
{
  _tempFilename = getNewTempFile();
  std::ofstream os(_tempFilename);
  os << text;
}

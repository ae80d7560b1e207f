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

#include "testUtil.hpp"

#include "boost/filesystem.hpp"

#include <fstream>
#include <sstream>

std::string getNewTempFile()
{
  using namespace boost::filesystem;

  const path tempDir(temp_directory_path());
  while (true) {
    path tempFile = tempDir / unique_path();
    if (exists(tempFile)) continue;
    return tempFile.string();
  }
}

std::string getFileContents(const std::string& filename)
{
  std::ifstream      ifs(filename);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

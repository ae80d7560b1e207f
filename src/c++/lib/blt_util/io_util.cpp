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

#include "blt_util/io_util.hpp"

#include "blt_util/blt_exception.hpp"

#include <fstream>
#include <sstream>

void open_ifstream(std::ifstream& ifs, const char* filename)
{
  ifs.open(filename);
  if (!ifs) {
    std::ostringstream oss;
    oss << "Can't open file: '" << filename << "'";
    throw blt_exception(oss.str().c_str());
  }
}

void open_ofstream(std::ofstream& ofs, const char* filename)
{
  ofs.open(filename);
  if (!ofs) {
    std::ostringstream oss;
    oss << "Can't open output file: '" << filename << "'";
    throw blt_exception(oss.str().c_str());
  }
}

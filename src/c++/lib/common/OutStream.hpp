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

#include "boost/noncopyable.hpp"

#include <iosfwd>
#include <memory>
#include <string>

/// report output stream, writes to fileName or to stdout if fileName is empty
///
/// fileName is opened once on construction to check that it is writable, and
/// again on the first call to getStream()
///
struct OutStream : private boost::noncopyable {
  explicit OutStream(const std::string& fileName);

  ~OutStream();

  std::ostream& getStream()
  {
    if (!_isInit) initStream();
    return *_osptr;
  }

  /// flush the stream and throw if any write to it has failed
  void close();

private:
  void initStream();

  static void openFile(const std::string& filename, std::ofstream& ofs);

  bool                           _isInit;
  std::string                    _fileName;
  std::ostream*                  _osptr;
  std::unique_ptr<std::ofstream> _ofsptr;
};

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

#include "report/ReportSet.hpp"

#include "blt_util/io_util.hpp"
#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

unsigned ReportSet::groupCount() const
{
  unsigned count(0);
  for (const auto& refValue : _refs) {
    count += refValue.second.size();
  }
  return count;
}

unsigned ReportSet::recordCount() const
{
  unsigned count(0);
  for (const auto& refValue : _refs) {
    for (const auto& contigValue : refValue.second) {
      count += contigValue.second.size();
    }
  }
  return count;
}

bool ReportSet::hasGroup(const std::string& refName, const std::string& contigName) const
{
  const auto refIter(_refs.find(refName));
  if (refIter == _refs.end()) return false;
  return (refIter->second.count(contigName) > 0);
}

const ReportSet::group_t& ReportSet::getGroup(const std::string& refName, const std::string& contigName) const
{
  if (!hasGroup(refName, contigName)) {
    using namespace asmreport::common;
    std::ostringstream oss;
    oss << "Report has no group for reference '" << refName << "' and contig '" << contigName << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
  return _refs.find(refName)->second.find(contigName)->second;
}

void ReportSet::addRecord(const ReportRecord& record)
{
  _refs[record.getRefName(_schema)][record.getContigName(_schema)].push_back(record);
}

void ReportSet::load(const char* filename)
{
  std::ifstream ifs;
  open_ifstream(ifs, filename);
  load(ifs, filename);
}

void ReportSet::load(std::istream& is, const char* streamLabel)
{
  clear();
  try {
    loadStream(is, streamLabel);
  } catch (...) {
    clear();
    throw;
  }
}

void ReportSet::loadStream(std::istream& is, const char* streamLabel)
{
  using namespace asmreport::common;

  const std::string expectedHeader(_schema.getHeaderLine());

  std::string  line;
  unsigned     lineNumber(0);
  ReportRecord record;
  while (std::getline(is, line)) {
    ++lineNumber;
    chomp_cr(line);

    if (lineNumber == 1) {
      if (line != expectedHeader) {
        std::ostringstream oss;
        oss << "Error reading report file '" << streamLabel << "'. Expected first line of file is\n"
            << expectedHeader << "\nbut got:\n"
            << line;
        BOOST_THROW_EXCEPTION(ReportFormatException(oss.str()));
      }
      continue;
    }

    try {
      record.parseLine(_schema, line);
    } catch (ReportFormatException& e) {
      std::ostringstream oss;
      oss << "Error reading report file '" << streamLabel << "' at line " << lineNumber;
      e << ExceptionMsg(oss.str());
      throw;
    }
    addRecord(record);
  }

  if (is.bad()) {
    std::ostringstream oss;
    oss << "Unexpected failure while reading report file '" << streamLabel << "' after line " << lineNumber;
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
}

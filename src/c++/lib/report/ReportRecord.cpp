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

#include "report/ReportRecord.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/parse_util.hpp"
#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

void ReportRecord::clear()
{
  _text.clear();
  _intValue.clear();
  _floatValue.clear();
  _flag = ReportFlag();
}

void ReportRecord::parseLine(const ReportSchema& schema, const std::string& line)
{
  using namespace asmreport::blt_util;
  using namespace asmreport::common;

  clear();

  split_string(line, '\t', _text);

  const unsigned columnCount(schema.size());
  if (_text.size() != columnCount) {
    std::ostringstream oss;
    oss << "Expected " << columnCount << " columns but got " << _text.size()
        << " columns at this line:\n"
        << line;
    BOOST_THROW_EXCEPTION(ReportFormatException(oss.str()));
  }

  _intValue.resize(columnCount);
  _floatValue.resize(columnCount);

  for (unsigned columnIndex(0); columnIndex < columnCount; ++columnIndex) {
    const REPORT_COLUMN_TYPE::index_t columnType(schema.getColumnType(columnIndex));
    if (columnType == REPORT_COLUMN_TYPE::STRING) continue;

    const std::string& text(_text[columnIndex]);

    // the flag column is always required to be an integer:
    if ((columnType != REPORT_COLUMN_TYPE::FLAG) && (text == ReportSchema::sentinel())) continue;

    try {
      if (columnType == REPORT_COLUMN_TYPE::INT) {
        _intValue[columnIndex] = parse_long_str(text);
      } else if (columnType == REPORT_COLUMN_TYPE::FLOAT) {
        _floatValue[columnIndex] = parse_double_str(text);
      } else {
        const int flagValue(parse_int_str(text));
        if (flagValue < 0) throw blt_exception("Flag value is negative");
        _flag = ReportFlag(static_cast<unsigned>(flagValue));
      }
    } catch (const blt_exception& e) {
      std::ostringstream oss;
      oss << "Can't convert value '" << text << "' in column '" << schema.getColumnName(columnIndex)
          << "' to type " << REPORT_COLUMN_TYPE::label(columnType) << " (" << e.what()
          << ") at this line:\n"
          << line;
      BOOST_THROW_EXCEPTION(ReportFormatException(oss.str()));
    }
  }
}

std::string ReportRecord::getLine() const
{
  return join_string(_text, '\t');
}

ReportRecord ReportRecord::getDemoted(const ReportSchema& schema) const
{
  ReportRecord demoted(*this);
  for (const unsigned columnIndex : schema.getVariantColumns()) {
    demoted._text[columnIndex] = ReportSchema::sentinel();
    demoted._intValue[columnIndex].reset();
    demoted._floatValue[columnIndex].reset();
  }
  return demoted;
}

std::ostream& operator<<(std::ostream& os, const ReportRecord& record)
{
  os << record.getLine();
  return os;
}

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
/// \brief A single row of the assembly report
///

#pragma once

#include "report/ReportFlag.hpp"
#include "report/ReportSchema.hpp"

#include "boost/optional.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// \brief one report row
///
/// Every column keeps its text exactly as it will be written back out. Integer
/// and float columns additionally hold their parsed value, which is empty when
/// the column holds the sentinel.
///
struct ReportRecord {
  /// parse one tab-delimited report line according to schema
  ///
  /// throws common::ReportFormatException if the column count does not match
  /// the schema or a numeric/flag column can't be converted
  void parseLine(const ReportSchema& schema, const std::string& line);

  /// tab-delimited column text in schema order
  std::string getLine() const;

  unsigned size() const { return _text.size(); }

  const std::string& getText(const unsigned columnIndex) const { return _text[columnIndex]; }

  const std::vector<std::string>& getTexts() const { return _text; }

  bool isSentinel(const unsigned columnIndex) const
  {
    return (_text[columnIndex] == ReportSchema::sentinel());
  }

  /// empty for the sentinel or a non-integer column
  const boost::optional<long>& getIntValue(const unsigned columnIndex) const
  {
    return _intValue[columnIndex];
  }

  /// empty for the sentinel or a non-float column
  const boost::optional<double>& getFloatValue(const unsigned columnIndex) const
  {
    return _floatValue[columnIndex];
  }

  const ReportFlag& getFlag() const { return _flag; }

  const std::string& getRefName(const ReportSchema& schema) const
  {
    return _text[schema.getRefNameColumn()];
  }

  const std::string& getContigName(const ReportSchema& schema) const
  {
    return _text[schema.getContigNameColumn()];
  }

  /// \brief copy of this record with every variant column set to the sentinel
  ///
  /// used to keep a placeholder row for a group where no row reports a known
  /// variant
  ReportRecord getDemoted(const ReportSchema& schema) const;

  bool operator==(const ReportRecord& rhs) const { return (_text == rhs._text); }

  bool operator!=(const ReportRecord& rhs) const { return (!(*this == rhs)); }

private:
  void clear();

  std::vector<std::string>             _text;
  std::vector<boost::optional<long>>   _intValue;
  std::vector<boost::optional<double>> _floatValue;
  ReportFlag                           _flag;
};

std::ostream& operator<<(std::ostream& os, const ReportRecord& record);

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
/// \brief Column layout of the tab-delimited assembly report
///

#pragma once

#include "boost/optional.hpp"

#include <map>
#include <string>
#include <vector>

namespace REPORT_COLUMN_TYPE {

enum index_t { STRING, INT, FLOAT, FLAG };

inline const char* label(const index_t i)
{
  switch (i) {
  case STRING:
    return "string";
  case INT:
    return "integer";
  case FLOAT:
    return "float";
  case FLAG:
    return "flag";
  default:
    return "UNKNOWN";
  }
}

}  // namespace REPORT_COLUMN_TYPE

/// \brief immutable description of the report columns
///
/// A single schema object is shared by the report parser, the filter and the
/// writers. Besides the ordered column names it records the type of each
/// column, the set of variant columns which are blanked when a record is
/// demoted, and the location of the columns the filter reads.
///
struct ReportSchema {
  /// \param columnNames all columns in file order
  /// \param intColumns subset of columnNames holding integers
  /// \param floatColumns subset of columnNames holding floats
  /// \param variantColumns subset of columnNames describing a variant call
  ///
  /// Throws common::GeneralException if a column name repeats, a subset names
  /// an unknown column, or any of the columns used by the filter is missing
  /// or has the wrong type.
  ReportSchema(
      const std::vector<std::string>& columnNames,
      const std::vector<std::string>& intColumns,
      const std::vector<std::string>& floatColumns,
      const std::vector<std::string>& variantColumns);

  /// the standard assembly report layout
  static const ReportSchema& getDefault();

  /// marks an absent or inapplicable column value
  static const std::string& sentinel();

  unsigned size() const { return _columnNames.size(); }

  const std::vector<std::string>& getColumnNames() const { return _columnNames; }

  const std::string& getColumnName(const unsigned columnIndex) const { return _columnNames[columnIndex]; }

  boost::optional<unsigned> getColumnIndex(const std::string& columnName) const;

  REPORT_COLUMN_TYPE::index_t getColumnType(const unsigned columnIndex) const
  {
    return _columnTypes[columnIndex];
  }

  bool isVariantColumn(const unsigned columnIndex) const { return _isVariantColumn[columnIndex]; }

  const std::vector<unsigned>& getVariantColumns() const { return _variantColumns; }

  /// '#' followed by the tab-delimited column names
  std::string getHeaderLine() const;

  unsigned getRefNameColumn() const { return _refNameColumn; }
  unsigned getContigNameColumn() const { return _contigNameColumn; }
  unsigned getFlagColumn() const { return _flagColumn; }
  unsigned getPercentIdentityColumn() const { return _percentIdentityColumn; }
  unsigned getRefBaseAssembledColumn() const { return _refBaseAssembledColumn; }
  unsigned getHasKnownVariantColumn() const { return _hasKnownVariantColumn; }

  bool operator==(const ReportSchema& rhs) const
  {
    return ((_columnNames == rhs._columnNames) && (_columnTypes == rhs._columnTypes) &&
            (_isVariantColumn == rhs._isVariantColumn));
  }

private:
  unsigned getRequiredColumn(const char* columnName, const REPORT_COLUMN_TYPE::index_t columnType) const;

  std::vector<std::string>                 _columnNames;
  std::vector<REPORT_COLUMN_TYPE::index_t> _columnTypes;
  std::vector<bool>                        _isVariantColumn;
  std::vector<unsigned>                    _variantColumns;
  std::map<std::string, unsigned>          _columnIndex;

  unsigned _refNameColumn;
  unsigned _contigNameColumn;
  unsigned _flagColumn;
  unsigned _percentIdentityColumn;
  unsigned _refBaseAssembledColumn;
  unsigned _hasKnownVariantColumn;
};

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

#include "report/ReportSchema.hpp"

#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"

#include <sstream>

namespace {

const char refNameLabel[]          = "ref_name";
const char contigNameLabel[]       = "ctg";
const char flagLabel[]             = "flag";
const char percentIdentityLabel[]  = "pc_ident";
const char refBaseAssembledLabel[] = "ref_base_assembled";
const char hasKnownVariantLabel[]  = "has_known_var";

void schemaError(const std::string& message)
{
  using namespace asmreport::common;
  BOOST_THROW_EXCEPTION(GeneralException("Invalid report schema: " + message));
}

}  // namespace

ReportSchema::ReportSchema(
    const std::vector<std::string>& columnNames,
    const std::vector<std::string>& intColumns,
    const std::vector<std::string>& floatColumns,
    const std::vector<std::string>& variantColumns)
  : _columnNames(columnNames),
    _columnTypes(columnNames.size(), REPORT_COLUMN_TYPE::STRING),
    _isVariantColumn(columnNames.size(), false)
{
  const unsigned columnCount(size());
  for (unsigned columnIndex(0); columnIndex < columnCount; ++columnIndex) {
    const std::string& columnName(_columnNames[columnIndex]);
    if (!_columnIndex.insert(std::make_pair(columnName, columnIndex)).second) {
      schemaError("repeated column name '" + columnName + "'");
    }
  }

  auto lookup = [&](const std::string& columnName) -> unsigned {
    const boost::optional<unsigned> columnIndex(getColumnIndex(columnName));
    if (!columnIndex) schemaError("unknown column name '" + columnName + "'");
    return *columnIndex;
  };

  for (const std::string& columnName : intColumns) {
    _columnTypes[lookup(columnName)] = REPORT_COLUMN_TYPE::INT;
  }
  for (const std::string& columnName : floatColumns) {
    const unsigned columnIndex(lookup(columnName));
    if (_columnTypes[columnIndex] != REPORT_COLUMN_TYPE::STRING) {
      schemaError("column '" + columnName + "' is declared with more than one type");
    }
    _columnTypes[columnIndex] = REPORT_COLUMN_TYPE::FLOAT;
  }

  {
    const boost::optional<unsigned> flagIndex(getColumnIndex(flagLabel));
    if (flagIndex) {
      if (_columnTypes[*flagIndex] != REPORT_COLUMN_TYPE::STRING) {
        schemaError(std::string("column '") + flagLabel + "' can't be declared numeric");
      }
      _columnTypes[*flagIndex] = REPORT_COLUMN_TYPE::FLAG;
    }
  }

  for (const std::string& columnName : variantColumns) {
    const unsigned columnIndex(lookup(columnName));
    if (_isVariantColumn[columnIndex]) continue;
    _isVariantColumn[columnIndex] = true;
    _variantColumns.push_back(columnIndex);
  }

  _refNameColumn          = getRequiredColumn(refNameLabel, REPORT_COLUMN_TYPE::STRING);
  _contigNameColumn       = getRequiredColumn(contigNameLabel, REPORT_COLUMN_TYPE::STRING);
  _flagColumn             = getRequiredColumn(flagLabel, REPORT_COLUMN_TYPE::FLAG);
  _percentIdentityColumn  = getRequiredColumn(percentIdentityLabel, REPORT_COLUMN_TYPE::FLOAT);
  _refBaseAssembledColumn = getRequiredColumn(refBaseAssembledLabel, REPORT_COLUMN_TYPE::INT);
  _hasKnownVariantColumn  = getRequiredColumn(hasKnownVariantLabel, REPORT_COLUMN_TYPE::STRING);

  if (_isVariantColumn[_refNameColumn] || _isVariantColumn[_contigNameColumn] ||
      _isVariantColumn[_flagColumn]) {
    schemaError("group key and flag columns can't be variant columns");
  }
}

unsigned ReportSchema::getRequiredColumn(
    const char* columnName, const REPORT_COLUMN_TYPE::index_t columnType) const
{
  const boost::optional<unsigned> columnIndex(getColumnIndex(columnName));
  if (!columnIndex) {
    schemaError(std::string("missing required column '") + columnName + "'");
  }
  if (_columnTypes[*columnIndex] != columnType) {
    std::ostringstream oss;
    oss << "required column '" << columnName << "' must have type " << REPORT_COLUMN_TYPE::label(columnType);
    schemaError(oss.str());
  }
  return *columnIndex;
}

boost::optional<unsigned> ReportSchema::getColumnIndex(const std::string& columnName) const
{
  const auto iter(_columnIndex.find(columnName));
  if (iter == _columnIndex.end()) return boost::none;
  return iter->second;
}

std::string ReportSchema::getHeaderLine() const
{
  return "#" + join_string(_columnNames, '\t');
}

const std::string& ReportSchema::sentinel()
{
  static const std::string sentinelValue(".");
  return sentinelValue;
}

const ReportSchema& ReportSchema::getDefault()
{
  static const ReportSchema schema(
      {"ariba_ref_name",
       "ref_name",
       "gene",
       "var_only",
       "flag",
       "reads",
       "cluster",
       "ref_len",
       "ref_base_assembled",
       "pc_ident",
       "ctg",
       "ctg_len",
       "ctg_cov",
       "known_var",
       "var_type",
       "var_seq_type",
       "known_var_change",
       "has_known_var",
       "ref_ctg_change",
       "ref_ctg_effect",
       "ref_start",
       "ref_end",
       "ref_nt",
       "ctg_start",
       "ctg_end",
       "ctg_nt",
       "smtls_total_depth",
       "smtls_nts",
       "smtls_nts_depth",
       "var_description",
       "free_text"},
      {"reads", "ref_len", "ref_base_assembled", "ctg_len", "ref_start", "ref_end", "ctg_start", "ctg_end"},
      {"pc_ident", "ctg_cov"},
      {"known_var",
       "var_type",
       "var_seq_type",
       "known_var_change",
       "has_known_var",
       "ref_ctg_change",
       "ref_ctg_effect",
       "ref_start",
       "ref_end",
       "ref_nt",
       "ctg_start",
       "ctg_end",
       "ctg_nt",
       "smtls_total_depth",
       "smtls_nts",
       "smtls_nts_depth",
       "var_description"});
  return schema;
}

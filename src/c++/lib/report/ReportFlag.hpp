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
/// \brief Named status bits attached to each row of an assembly report
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace REPORT_FLAG {

/// bit i of the report flag column has value 2^i
enum index_t {
  ASSEMBLED,
  ASSEMBLED_INTO_ONE_CONTIG,
  REGION_ASSEMBLED_TWICE,
  COMPLETE_GENE,
  UNIQUE_CONTIG,
  SCAFFOLD_GRAPH_BAD,
  ASSEMBLY_FAIL,
  VARIANTS_SUGGEST_COLLAPSED_REPEAT,
  HIT_BOTH_STRANDS,
  HAS_VARIANT,
  REF_SEQ_CHOOSE_FAIL,
  SIZE
};

inline const char* label(const index_t i)
{
  switch (i) {
  case ASSEMBLED:
    return "assembled";
  case ASSEMBLED_INTO_ONE_CONTIG:
    return "assembled_into_one_contig";
  case REGION_ASSEMBLED_TWICE:
    return "region_assembled_twice";
  case COMPLETE_GENE:
    return "complete_gene";
  case UNIQUE_CONTIG:
    return "unique_contig";
  case SCAFFOLD_GRAPH_BAD:
    return "scaffold_graph_bad";
  case ASSEMBLY_FAIL:
    return "assembly_fail";
  case VARIANTS_SUGGEST_COLLAPSED_REPEAT:
    return "variants_suggest_collapsed_repeat";
  case HIT_BOTH_STRANDS:
    return "hit_both_strands";
  case HAS_VARIANT:
    return "has_variant";
  case REF_SEQ_CHOOSE_FAIL:
    return "ref_seq_choose_fail";
  default:
    return "UNKNOWN";
  }
}

/// inefficient label to id lookup, returns SIZE for unknown string:
index_t get_index(const std::string& str);

}  // namespace REPORT_FLAG

/// flag bitset wrapper, queried by bit name rather than raw value
struct ReportFlag {
  ReportFlag() : _val(0) {}

  explicit ReportFlag(const unsigned val) : _val(val) {}

  unsigned value() const { return _val; }

  bool has(const REPORT_FLAG::index_t i) const { return (_val & bit(i)); }

  /// throws common::GeneralException for an unknown flag name
  bool has(const std::string& flagName) const;

  void add(const REPORT_FLAG::index_t i) { _val |= bit(i); }

  void add(const std::string& flagName);

  /// labels of all set bits, in bit order
  std::vector<std::string> getSetLabels() const;

  /// one '[X] name' or '[ ] name' line for each known bit
  void writeLongString(std::ostream& os) const;

  bool operator==(const ReportFlag& rhs) const { return (_val == rhs._val); }

  bool operator!=(const ReportFlag& rhs) const { return (!(*this == rhs)); }

private:
  static unsigned bit(const REPORT_FLAG::index_t i) { return (1u << i); }

  static REPORT_FLAG::index_t getKnownIndex(const std::string& flagName);

  unsigned _val;
};

/// the report file encoding of the flag is its integer value
std::ostream& operator<<(std::ostream& os, const ReportFlag& flag);

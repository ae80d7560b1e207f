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
/// \brief In-memory assembly report, grouped by reference and contig
///

#pragma once

#include "report/ReportRecord.hpp"
#include "report/ReportSchema.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

/// \brief all records of a report, as a reference name -> contig name -> records tree
///
/// Both levels are ordered lexicographically by name, records within a group
/// keep their input order. A group is the unit of filtering.
///
struct ReportSet {
  typedef std::vector<ReportRecord>              group_t;
  typedef std::map<std::string, group_t>         contig_map_t;
  typedef std::map<std::string, contig_map_t>    ref_map_t;
  typedef ref_map_t::const_iterator              const_iterator;

  explicit ReportSet(const ReportSchema& schema = ReportSchema::getDefault()) : _schema(schema) {}

  const ReportSchema& getSchema() const { return _schema; }

  bool empty() const { return _refs.empty(); }

  /// number of reference names
  unsigned size() const { return _refs.size(); }

  /// number of (reference, contig) groups
  unsigned groupCount() const;

  unsigned recordCount() const;

  const_iterator begin() const { return _refs.begin(); }
  const_iterator end() const { return _refs.end(); }

  bool hasGroup(const std::string& refName, const std::string& contigName) const;

  /// throws common::GeneralException if the group does not exist
  const group_t& getGroup(const std::string& refName, const std::string& contigName) const;

  /// append record to the end of its group, creating the group as required
  void addRecord(const ReportRecord& record);

  /// \brief replace the records of every group with the result of filterFunc(group)
  ///
  /// Groups left empty are removed, as is any reference left without groups.
  /// Removal happens only after all groups have been visited.
  ///
  template <typename FilterFunc>
  void filterGroups(FilterFunc filterFunc);

  /// read a report file, replacing the current contents
  ///
  /// throws common::ReportFormatException for a header or row which does not match
  /// the schema, in which case the set is left empty
  void load(const char* filename);

  /// \param[in] streamLabel name used for the input in error messages
  void load(std::istream& is, const char* streamLabel);

  void clear() { _refs.clear(); }

  bool operator==(const ReportSet& rhs) const { return ((_schema == rhs._schema) && (_refs == rhs._refs)); }

private:
  void loadStream(std::istream& is, const char* streamLabel);

  ReportSchema _schema;
  ref_map_t    _refs;
};

template <typename FilterFunc>
void ReportSet::filterGroups(FilterFunc filterFunc)
{
  typedef std::pair<std::string, std::string> group_key_t;
  std::vector<group_key_t> emptyGroups;

  for (auto& refValue : _refs) {
    for (auto& contigValue : refValue.second) {
      group_t& group(contigValue.second);
      group = filterFunc(static_cast<const group_t&>(group));
      if (group.empty()) emptyGroups.emplace_back(refValue.first, contigValue.first);
    }
  }

  for (const group_key_t& key : emptyGroups) {
    const auto refIter(_refs.find(key.first));
    refIter->second.erase(key.second);
    if (refIter->second.empty()) _refs.erase(refIter);
  }
}

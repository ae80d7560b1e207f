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
/// \brief Selection of the report records which pass quality and flag thresholds
///

#pragma once

#include "options/ReportFilterOptions.hpp"
#include "report/ReportFlag.hpp"
#include "report/ReportSchema.hpp"
#include "report/ReportSet.hpp"

#include <iosfwd>
#include <vector>

/// counts accumulated over one filterReport() call
struct ReportFilterStats {
  ReportFilterStats()
    : inputRecordCount(0),
      passRecordCount(0),
      demotedGroupCount(0),
      removedGroupCount(0),
      removedRefCount(0)
  {
  }

  void report(std::ostream& os) const;

  unsigned inputRecordCount;

  /// records passing both the essential and non-essential filters
  unsigned passRecordCount;

  /// groups reduced to a single record with variant columns blanked
  unsigned demotedGroupCount;

  /// groups with no record passing the essential filters
  unsigned removedGroupCount;

  /// references left without any group
  unsigned removedRefCount;
};

/// \brief applies the record filters to each reference/contig group of a report
///
/// A record passes the essential filters if it has none of the excluded flags
/// set, and its percent identity and assembled reference base count reach the
/// configured minimums. A sentinel in either numeric column fails. The
/// non-essential filter requires the record to report a known variant and can
/// be disabled.
///
/// Within each group:
/// - if any record passes all filters, exactly those records are kept in input order
/// - otherwise, if any record passes the essential filters, only the first of these
///   is kept, with all variant columns set to the sentinel
/// - otherwise the group is removed
///
struct ReportFilter {
  /// throws common::GeneralException if opt names an unknown flag
  ReportFilter(const ReportSchema& schema, const ReportFilterOptions& opt);

  bool isPassEssentialFilters(const ReportRecord& record) const;

  bool isPassNonEssentialFilters(const ReportRecord& record) const;

  bool isPassFilters(const ReportRecord& record) const
  {
    return (isPassEssentialFilters(record) && isPassNonEssentialFilters(record));
  }

  /// \brief select the records of a single group
  ///
  /// \param[in,out] stats if non-null, record and demotion counts are added here
  ReportSet::group_t filterGroup(const ReportSet::group_t& group, ReportFilterStats* stats = nullptr) const;

  /// filter all groups of reportSet in place, removing empty groups and references
  ///
  /// throws common::GeneralException if reportSet uses a different schema
  void filterReport(ReportSet& reportSet, ReportFilterStats& stats) const;

  void filterReport(ReportSet& reportSet) const
  {
    ReportFilterStats stats;
    filterReport(reportSet, stats);
  }

private:
  ReportSchema                      _schema;
  ReportFilterOptions               _opt;
  std::vector<REPORT_FLAG::index_t> _excludeFlags;
};

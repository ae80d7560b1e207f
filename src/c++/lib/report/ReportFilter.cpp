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

#include "report/ReportFilter.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

void ReportFilterStats::report(std::ostream& os) const
{
  os << "InputRecordCount\t" << inputRecordCount << "\n";
  os << "PassRecordCount\t" << passRecordCount << "\n";
  os << "DemotedGroupCount\t" << demotedGroupCount << "\n";
  os << "RemovedGroupCount\t" << removedGroupCount << "\n";
  os << "RemovedReferenceCount\t" << removedRefCount << "\n";
}

ReportFilter::ReportFilter(const ReportSchema& schema, const ReportFilterOptions& opt)
  : _schema(schema), _opt(opt)
{
  for (const std::string& flagName : _opt.excludeFlags) {
    const REPORT_FLAG::index_t index(REPORT_FLAG::get_index(flagName));
    if (index == REPORT_FLAG::SIZE) {
      using namespace asmreport::common;
      std::ostringstream oss;
      oss << "Unknown report flag name in filter exclusion list: '" << flagName << "'";
      BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
    _excludeFlags.push_back(index);
  }
}

bool ReportFilter::isPassEssentialFilters(const ReportRecord& record) const
{
  const ReportFlag& flag(record.getFlag());
  for (const REPORT_FLAG::index_t flagIndex : _excludeFlags) {
    if (flag.has(flagIndex)) return false;
  }

  const boost::optional<double>& percentIdentity(
      record.getFloatValue(_schema.getPercentIdentityColumn()));
  if ((!percentIdentity) || (!(*percentIdentity >= _opt.minPercentIdentity))) return false;

  const boost::optional<long>& refBaseAssembled(record.getIntValue(_schema.getRefBaseAssembledColumn()));
  if ((!refBaseAssembled) || (!(*refBaseAssembled >= _opt.minRefBaseAssembled))) return false;

  return true;
}

bool ReportFilter::isPassNonEssentialFilters(const ReportRecord& record) const
{
  if (!_opt.isRequireKnownVariant) return true;
  return (record.getText(_schema.getHasKnownVariantColumn()) == "1");
}

ReportSet::group_t ReportFilter::filterGroup(const ReportSet::group_t& group, ReportFilterStats* stats) const
{
  ReportSet::group_t passRecords;
  ReportSet::group_t essentialRecords;

  for (const ReportRecord& record : group) {
    if (!isPassEssentialFilters(record)) continue;
    if (isPassNonEssentialFilters(record)) {
      passRecords.push_back(record);
    } else {
      essentialRecords.push_back(record);
    }
  }

  if (nullptr != stats) {
    stats->inputRecordCount += group.size();
    stats->passRecordCount += passRecords.size();
  }

  if (passRecords.empty() && (!essentialRecords.empty())) {
    passRecords.push_back(essentialRecords.front().getDemoted(_schema));
    if (nullptr != stats) stats->demotedGroupCount++;
  }

  return passRecords;
}

void ReportFilter::filterReport(ReportSet& reportSet, ReportFilterStats& stats) const
{
  if (!(reportSet.getSchema() == _schema)) {
    using namespace asmreport::common;
    BOOST_THROW_EXCEPTION(GeneralException("Report filter and report set have different column schemas"));
  }

  const unsigned groupCount(reportSet.groupCount());
  const unsigned refCount(reportSet.size());

  reportSet.filterGroups(
      [&](const ReportSet::group_t& group) { return filterGroup(group, &stats); });

  stats.removedGroupCount += (groupCount - reportSet.groupCount());
  stats.removedRefCount += (refCount - reportSet.size());
}

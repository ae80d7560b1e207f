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

#include <string>
#include <vector>

/// thresholds used to select report records
///
struct ReportFilterOptions {
  ReportFilterOptions()
    : minPercentIdentity(90),
      minRefBaseAssembled(1),
      isRequireKnownVariant(true),
      excludeFlags({"assembly_fail", "ref_seq_choose_fail"})
  {
  }

  /// Records with a lower percent identity to the reference fail the essential filters
  double minPercentIdentity;

  /// Records with fewer assembled reference bases fail the essential filters
  long minRefBaseAssembled;

  /// If true, records must report a known variant to pass the non-essential filter
  bool isRequireKnownVariant;

  /// Records with any of these flags set fail the essential filters
  std::vector<std::string> excludeFlags;
};

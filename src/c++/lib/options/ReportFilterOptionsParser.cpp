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

#include "options/ReportFilterOptionsParser.hpp"

#include "report/ReportFlag.hpp"

#include <set>
#include <sstream>

typedef std::vector<std::string> flags_t;

namespace {
const char excludeFlagKey[] = "exclude-flag";
const char keepNotKnownKey[] = "keep-not-has-known-variant";
}  // namespace

boost::program_options::options_description getOptionsDescription(ReportFilterOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("report-filter");
  // clang-format off
  desc.add_options()
  ("min-pc-ident", po::value(&opt.minPercentIdentity)->default_value(opt.minPercentIdentity),
   "Records with percent identity below this value are removed, value must be in [0,100]")
  ("min-ref-base-assembled", po::value(&opt.minRefBaseAssembled)->default_value(opt.minRefBaseAssembled),
   "Records with fewer assembled reference bases than this are removed")
  (keepNotKnownKey, po::bool_switch(),
   "Do not require records to report a known variant. By default, if no record of a reference/contig"
   " group reports a known variant, only the first record passing all other filters is kept with its"
   " variant columns blanked")
  (excludeFlagKey, po::value<flags_t>(),
   "Records with this flag set are removed (may be specified multiple times, replaces the default set"
   " of 'assembly_fail' and 'ref_seq_choose_fail')")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& vm, ReportFilterOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();

  if (vm.count(keepNotKnownKey) && vm[keepNotKnownKey].as<bool>()) {
    opt.isRequireKnownVariant = false;
  }

  if (vm.count(excludeFlagKey)) {
    opt.excludeFlags = boost::any_cast<flags_t>(vm[excludeFlagKey].value());
  }

  if (!((opt.minPercentIdentity >= 0) && (opt.minPercentIdentity <= 100))) {
    errorMsg = "min-pc-ident must be in range [0,100]";
  } else if (opt.minRefBaseAssembled < 0) {
    errorMsg = "min-ref-base-assembled must be 0 or greater";
  } else {
    // check that flag names are known and do not repeat
    std::set<std::string> nameCheck;
    for (const std::string& flagName : opt.excludeFlags) {
      std::ostringstream oss;
      if (REPORT_FLAG::get_index(flagName) == REPORT_FLAG::SIZE) {
        oss << "exclude-flag argument '" << flagName << "' is not a known flag name";
      } else if (nameCheck.count(flagName)) {
        oss << "Repeated exclude-flag argument: " << flagName;
      }
      errorMsg = oss.str();
      if (!errorMsg.empty()) break;
      nameCheck.insert(flagName);
    }
  }

  return (!errorMsg.empty());
}

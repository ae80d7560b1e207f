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

#include "FROptions.hpp"

#include "blt_util/log.hpp"
#include "common/ProgramUtil.hpp"
#include "options/ReportFilterOptionsParser.hpp"
#include "options/optionsUtil.hpp"

#include "boost/filesystem.hpp"
#include "boost/program_options.hpp"

#include <iostream>

static void usage(
    std::ostream&                                      os,
    const asmreport::Program&                          prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr)
{
  usage(
      os,
      prog,
      visible,
      "remove report rows which fail quality and flag thresholds, write the remaining rows as tsv and xls",
      "",
      msg);
}

bool checkFROptions(FROptions& opt, std::string& errorMsg)
{
  errorMsg.clear();
  if (checkAndStandardizeRequiredInputFilePath(opt.reportFilename, "report", errorMsg)) return true;

  if (opt.outputPrefix.empty()) {
    errorMsg = "Must specify output-prefix";
  } else {
    // output files are not created until the report has been loaded and filtered, so check the
    // output directory up front:
    const boost::filesystem::path outputDir(boost::filesystem::path(opt.outputPrefix).parent_path());
    if ((!outputDir.empty()) && (!boost::filesystem::is_directory(outputDir))) {
      errorMsg = "Can't find directory for output-prefix '" + opt.outputPrefix + "'";
    }
  }
  return (!errorMsg.empty());
}

void parseFROptions(const asmreport::Program& prog, int argc, char* argv[], FROptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("report-file", po::value(&opt.reportFilename),
   "assembly report file to filter (required)")
  ("output-prefix", po::value(&opt.outputPrefix),
   "write filtered report to files 'PREFIX.tsv' and 'PREFIX.xls' (required)")
  ("verbose", po::value(&opt.isVerbose)->zero_tokens(),
   "provide additional progress and filter summary output")
  ;
  // clang-format on

  po::options_description filterOpt(getOptionsDescription(opt.filterOpt));

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(req).add(filterOpt).add(help);

  bool              po_parse_fail(false);
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, visible), vm);
    po::notify(vm);
  } catch (const boost::program_options::error& e) {
    log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
    po_parse_fail = true;
  }

  if ((argc <= 1) || (vm.count("help")) || po_parse_fail) {
    usage(log_os, prog, visible);
  }

  std::string errorMsg;
  if (parseOptions(vm, opt.filterOpt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }

  if (checkFROptions(opt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}

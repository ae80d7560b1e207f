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

#include "FilterReport.hpp"
#include "FROptions.hpp"

#include "blt_util/log.hpp"
#include "report/ReportFilter.hpp"
#include "report/ReportSet.hpp"
#include "report/ReportTsvWriter.hpp"
#include "report/ReportWorkbookWriter.hpp"

#include <iostream>

void runFR(const FROptions& opt)
{
  const ReportSchema& schema(ReportSchema::getDefault());
  const ReportFilter  filter(schema, opt.filterOpt);

  if (opt.isVerbose) {
    log_os << "INFO: Loading report file: '" << opt.reportFilename << "'\n";
  }

  ReportSet reportSet(schema);
  reportSet.load(opt.reportFilename.c_str());

  if (opt.isVerbose) {
    log_os << "INFO: Loaded " << reportSet.recordCount() << " records in " << reportSet.groupCount()
           << " reference/contig groups\n";
  }

  ReportFilterStats stats;
  filter.filterReport(reportSet, stats);

  if (opt.isVerbose) {
    log_os << "INFO: Finished filtering report, summary:\n";
    stats.report(log_os);
  }

  writeReportWorkbook(reportSet, opt.getWorkbookFilename());
  writeReportTsv(reportSet, opt.getTsvFilename());

  if (opt.isVerbose) {
    log_os << "INFO: Wrote filtered report to '" << opt.getTsvFilename() << "' and '"
           << opt.getWorkbookFilename() << "'\n";
  }
}

void FilterReport::runInternal(int argc, char* argv[]) const
{
  FROptions opt;

  parseFROptions(*this, argc, argv, opt);
  runFR(opt);
}

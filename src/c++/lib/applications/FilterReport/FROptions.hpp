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

#include "common/Program.hpp"
#include "options/ReportFilterOptions.hpp"

#include <string>

struct FROptions {
  FROptions() : isVerbose(false) {}

  std::string getTsvFilename() const { return outputPrefix + ".tsv"; }

  std::string getWorkbookFilename() const { return outputPrefix + ".xls"; }

  std::string         reportFilename;
  std::string         outputPrefix;
  ReportFilterOptions filterOpt;
  bool                isVerbose;
};

/// \brief parse FilterReport command line into opt
///
/// writes usage and exits on a help request or any option error
void parseFROptions(const asmreport::Program& prog, int argc, char* argv[], FROptions& opt);

/// \brief check options which do not require the command line
///
/// \return True if an error occurs, in which case errorMsg is set
bool checkFROptions(FROptions& opt, std::string& errorMsg);

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

#include "blt_util/sig_handler.hpp"
#include "blt_util/log.hpp"

#include <signal.h>
#include <cstdlib>

#include <iostream>
#include <string>

namespace {

std::string signalProgramName;
std::string signalCommandLine;

void exitOnSignal(int sig)
{
  const char* signalLabel((sig == SIGINT) ? "interrupt" : "termination");
  log_os << "ERROR: " << signalProgramName << " received " << signalLabel
         << " signal. cmdline: " << signalCommandLine << std::endl;
  exit(EXIT_FAILURE);
}

}  // namespace

void initialize_blt_signals(const char* progname, const char* cmdline)
{
  signalProgramName = progname;
  signalCommandLine = cmdline;

  for (const int sig : {SIGTERM, SIGINT}) {
    signal(sig, exitOnSignal);
  }
}

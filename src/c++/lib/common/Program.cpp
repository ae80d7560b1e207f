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

#include "Program.hpp"
#include "Exceptions.hpp"
#include "ProgramConfig.hpp"

#include "blt_util/blt_exception.hpp"
#include "blt_util/log.hpp"
#include "blt_util/sig_handler.hpp"
#include "blt_util/string_util.hpp"

#include <cstdlib>

#include <iostream>
#include <string>
#include <vector>

static std::string getCommandLine(int argc, char* argv[])
{
  return join_string(std::vector<std::string>(argv, argv + argc), ' ');
}

namespace asmreport {

const char* Program::version() const
{
  return getVersion();
}

const char* Program::compiler() const
{
  static const std::string compilerLabel(cxxCompilerName() + std::string("-") + compilerVersion());
  return compilerLabel.c_str();
}

const char* Program::buildTime() const
{
  return getBuildTime();
}

void Program::post_catch(const std::string& cmdline, std::ostream& os) const
{
  os << "cmdline:\t" << cmdline << "\n"
     << "version:\t" << version() << "\n"
     << "buildTime:\t" << buildTime() << "\n"
     << "compiler:\t" << compiler() << "\n"
     << std::flush;
  exit(EXIT_FAILURE);
}

int Program::run(int argc, char* argv[]) const
{
  std::ios_base::sync_with_stdio(false);

  const std::string cmdline(getCommandLine(argc, argv));

  try {
    initialize_blt_signals(name(), cmdline.c_str());
    runInternal(argc, argv);
  } catch (const blt_exception& e) {
    log_os << "FATAL_ERROR: " << name() << ": " << e.what() << "\n";
    post_catch(cmdline, log_os);
  } catch (const common::ExceptionData& e) {
    // the context includes the exception message
    log_os << "FATAL_ERROR: " << name() << ": " << e.getContext() << "\n";
    post_catch(cmdline, log_os);
  } catch (const boost::exception& e) {
    log_os << "FATAL_ERROR: " << name() << ": " << boost::diagnostic_information(e) << "\n";
    post_catch(cmdline, log_os);
  } catch (const std::exception& e) {
    log_os << "FATAL_ERROR: " << name() << ": " << e.what() << "\n";
    post_catch(cmdline, log_os);
  } catch (...) {
    log_os << "FATAL_ERROR: " << name() << ": unknown exception\n";
    post_catch(cmdline, log_os);
  }
  return EXIT_SUCCESS;
}

}  // namespace asmreport

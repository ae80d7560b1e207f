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

/// split str on every occurrence of delimiter
///
/// empty fields are retained unless isSkipEmpty is set, so a string with N
/// delimiters always produces N+1 words by default
void split_string(
    const std::string&        str,
    const char                delimiter,
    std::vector<std::string>& v,
    const bool                isSkipEmpty = false);

/// inverse of split_string
std::string join_string(const std::vector<std::string>& v, const char delimiter);

/// remove a single trailing carriage return, if present
void chomp_cr(std::string& str);

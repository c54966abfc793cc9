//
// SVPairGenotyper - Read-pair genotyping of structural variant calls
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
/// \author Chris Saunders
///

#pragma once

#include <string>

namespace svgt {
namespace blt_util {

/// parse c-string to TYPE
///
/// tolerates a non-TYPE suffix, but a non-empty prefix must be parsable as a TYPE,
/// on completion the value of s will reflect the extent of the parse
///
int parse_int(const char*& s);

long parse_long(const char*& s);

/// parse c-string to TYPE
///
/// similar to above functions but:
/// - entire string must be convertible, no trailing suffix is allowed
/// - appropriate for rvalue char pointers
///
int parse_int_rvalue(const char* s);

long parse_long_rvalue(const char* s);

/// parse std::string to TYPE
///
/// entire string must be convertible, no trailing suffix is allowed
///
int parse_int_str(const std::string& s);

}  // namespace blt_util
}  // namespace svgt

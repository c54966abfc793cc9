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

#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/blt_exception.hpp"

#include <cctype>
#include <cstring>

#include <iostream>
#include <sstream>

void istream_line_splitter::write_line(std::ostream& os) const
{
  for (unsigned i(0); i < n_word(); ++i) {
    if (i) os << _sep;
    os << _words[i];
  }
  os << "\n";
}

void istream_line_splitter::dump(std::ostream& os) const
{
  os << "\tline_no: " << _line_no << "\n";
  os << "\tline: ";
  write_line(os);
}

bool istream_line_splitter::is_blank() const
{
  for (const char c : _line) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool istream_line_splitter::is_line_prefix(const char* prefix) const
{
  return (0 == _line.compare(0, strlen(prefix), prefix));
}

bool istream_line_splitter::parse_line()
{
  _words.clear();
  if (!std::getline(_is, _line)) {
    if (_is.bad()) {
      std::ostringstream oss;
      oss << "Unexpected failure while attempting to read line " << (_line_no + 1);
      throw blt_exception(oss.str().c_str());
    }
    return false;
  }
  _line_no++;

  // tolerate windows line endings:
  if ((!_line.empty()) && (_line.back() == '\r')) _line.pop_back();

  size_t start(0);
  while (true) {
    const size_t next(_line.find(_sep, start));
    _words.emplace_back(_line.substr(start, next - start));
    if (next == std::string::npos) break;
    start = next + 1;
  }
  return true;
}

bool is_bed_header_or_blank(const istream_line_splitter& dparse)
{
  return (
      dparse.is_blank() || dparse.is_line_prefix("#") || dparse.is_line_prefix("track") ||
      dparse.is_line_prefix("browser"));
}

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
/// line-oriented parser for basic tab-delimited files
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

/// \brief Split each line of an input stream into words
///
/// usage example:
///
/// istream_line_splitter dparse(data_is);
/// while (dparse.parse_line()) {
///     if (dparse.n_word() < 3) {
///         std::ostringstream oss;
///         oss << "Unexpected number of columns in line:\n\n";
///         dparse.dump(oss);
///         throw blt_exception(oss.str().c_str());
///     }
///     const std::string& chrom(dparse.word(0));
///     ...
/// }
///
struct istream_line_splitter {
  explicit istream_line_splitter(std::istream& is, const char word_seperator = '\t')
    : _is(is), _line_no(0), _sep(word_seperator)
  {
  }

  unsigned n_word() const { return _words.size(); }

  const std::string& word(const unsigned index) const { return _words[index]; }

  /// number of the line most recently parsed, starting from 1
  unsigned line_no() const { return _line_no; }

  /// read and split the next line
  ///
  /// \return false for regular end of input, a stream failure other than end of input throws
  bool parse_line();

  /// true if the current line is empty or holds only whitespace
  bool is_blank() const;

  /// true if the current line begins with prefix
  bool is_line_prefix(const char* prefix) const;

  /// recreates the line before parsing
  void write_line(std::ostream& os) const;

  /// debug output, which provides line number and other info before calling write_line
  void dump(std::ostream& os) const;

private:
  std::istream&            _is;
  unsigned                 _line_no;
  char                     _sep;
  std::string              _line;
  std::vector<std::string> _words;
};

/// true for blank lines and for the "#", "track" or "browser" header lines of BED-like files
bool is_bed_header_or_blank(const istream_line_splitter& dparse);

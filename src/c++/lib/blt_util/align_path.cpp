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

#include "blt_util/align_path.hpp"
#include "blt_util/blt_exception.hpp"
#include "blt_util/parse_util.hpp"

#include <cassert>
#include <cctype>

#include <iostream>
#include <sstream>

namespace ALIGNPATH {

static void unknown_cigar_error(const char* cigar, const char* cptr)
{
  std::ostringstream oss;
  oss << "Can't parse cigar string: " << cigar << "\n"
      << "\tunexpected character: '" << *cptr << "' at position: " << (cptr - cigar + 1);
  throw blt_exception(oss.str().c_str());
}

std::string apath_to_cigar(const path_t& apath)
{
  std::ostringstream oss;
  oss << apath;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const path_t& apath)
{
  for (const path_segment& ps : apath) {
    os << ps.length << segment_type_to_cigar_code(ps.type);
  }
  return os;
}

void cigar_to_apath(const char* cigar, path_t& apath)
{
  using svgt::blt_util::parse_long;

  assert(nullptr != cigar);

  apath.clear();

  path_segment lps;
  const char*  cptr(cigar);
  while (*cptr) {
    path_segment ps;
    // expect sequences of digits and cigar codes:
    if (!isdigit(*cptr)) unknown_cigar_error(cigar, cptr);
    ps.length = static_cast<unsigned>(parse_long(cptr));
    ps.type   = cigar_code_to_segment_type(*cptr);
    if (ps.type == NONE) unknown_cigar_error(cigar, cptr);
    cptr++;
    if ((ps.type == PAD) || (ps.length == 0)) continue;

    if (ps.type != lps.type) {
      if (lps.type != NONE) apath.push_back(lps);
      lps = ps;
    } else {
      lps.length += ps.length;
    }
  }

  if (lps.type != NONE) apath.push_back(lps);
}

unsigned apath_ref_length(const path_t& apath)
{
  unsigned val(0);
  for (const path_segment& ps : apath) {
    if (is_segment_align_match(ps.type) || is_segment_type_ref_gap(ps.type)) val += ps.length;
  }
  return val;
}

unsigned apath_read_length(const path_t& apath)
{
  unsigned val(0);
  for (const path_segment& ps : apath) {
    if (!is_segment_type_read_length(ps.type)) continue;
    val += ps.length;
  }
  return val;
}

unsigned apath_aligned_query_length(const path_t& apath)
{
  unsigned val(0);
  for (const path_segment& ps : apath) {
    if (is_segment_align_match(ps.type) || (ps.type == INSERT)) val += ps.length;
  }
  return val;
}

bool is_leading_soft_clip(const path_t& apath)
{
  return ((!apath.empty()) && (apath.front().type == SOFT_CLIP));
}

bool is_trailing_soft_clip(const path_t& apath)
{
  return ((!apath.empty()) && (apath.back().type == SOFT_CLIP));
}

void apath_aligned_blocks(const pos_t refBeginPos, const path_t& apath, std::vector<known_pos_range2>& blocks)
{
  blocks.clear();

  pos_t refPos(refBeginPos);
  bool  isPriorAlignMatch(false);
  for (const path_segment& ps : apath) {
    const bool isAlignMatch(is_segment_align_match(ps.type));
    if (isAlignMatch) {
      if (isPriorAlignMatch) {
        blocks.back().set_end_pos(refPos + static_cast<pos_t>(ps.length));
      } else {
        blocks.emplace_back(refPos, refPos + static_cast<pos_t>(ps.length));
      }
      refPos += ps.length;
    } else if (is_segment_type_ref_gap(ps.type)) {
      refPos += ps.length;
    }
    isPriorAlignMatch = isAlignMatch;
  }
}

}  // namespace ALIGNPATH

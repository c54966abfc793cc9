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

#include "blt_util/known_pos_range2.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace ALIGNPATH {

/// segment types follow the htslib BAM_C* code order offset by one, so that NONE can be zero
enum align_t { NONE, MATCH, INSERT, DELETE, SKIP, SOFT_CLIP, HARD_CLIP, PAD, SEQ_MATCH, SEQ_MISMATCH };

inline char segment_type_to_cigar_code(const align_t id)
{
  switch (id) {
  case MATCH:
    return 'M';
  case INSERT:
    return 'I';
  case DELETE:
    return 'D';
  case SKIP:
    return 'N';
  case SOFT_CLIP:
    return 'S';
  case HARD_CLIP:
    return 'H';
  case PAD:
    return 'P';
  case SEQ_MATCH:
    return '=';
  default:
    return 'X';
  }
}

inline align_t cigar_code_to_segment_type(const char c)
{
  switch (c) {
  case 'M':
    return MATCH;
  case 'I':
    return INSERT;
  case 'D':
    return DELETE;
  case 'N':
    return SKIP;
  case 'S':
    return SOFT_CLIP;
  case 'H':
    return HARD_CLIP;
  case 'P':
    return PAD;
  case '=':
    return SEQ_MATCH;
  case 'X':
    return SEQ_MISMATCH;
  default:
    return NONE;
  }
}

inline bool is_segment_align_match(const align_t id)
{
  switch (id) {
  case MATCH:
  case SEQ_MATCH:
  case SEQ_MISMATCH:
    return true;
  default:
    return false;
  }
}

/// segments which consume read positions
inline bool is_segment_type_read_length(const align_t id)
{
  switch (id) {
  case INSERT:
  case SOFT_CLIP:
    return true;
  default:
    return is_segment_align_match(id);
  }
}

/// segments which consume reference positions without an aligned base
inline bool is_segment_type_ref_gap(const align_t id)
{
  return ((id == DELETE) || (id == SKIP));
}

struct path_segment {
  path_segment(const align_t t = NONE, const unsigned l = 0) : type(t), length(l) {}

  bool operator==(const path_segment& rhs) const { return ((type == rhs.type) && (length == rhs.length)); }

  align_t  type;
  unsigned length;
};

typedef std::vector<path_segment> path_t;

std::ostream& operator<<(std::ostream& os, const path_t& apath);

std::string apath_to_cigar(const path_t& apath);

/// \brief Convert CIGAR string into apath format
///
/// Any padding in the CIGAR string is removed, zero-length segments are skipped, and adjacent
/// segments of the same type are joined.
void cigar_to_apath(const char* cigar, path_t& apath);

/// \return The reference length spanned by the path
unsigned apath_ref_length(const path_t& apath);

/// \return The read length, including soft clipped segments
unsigned apath_read_length(const path_t& apath);

/// \return The query length excluding edge clipping (align match and insertion segments)
unsigned apath_aligned_query_length(const path_t& apath);

/// \return True if the first segment of the path is a soft-clip
bool is_leading_soft_clip(const path_t& apath);

/// \return True if the last segment of the path is a soft-clip
bool is_trailing_soft_clip(const path_t& apath);

/// \brief Get the reference ranges of all gap-free aligned blocks in the path
///
/// Each run of align match segments forms one block, a new block starts after every deletion, refskip or
/// insertion, so that an insertion splits two adjacent blocks without a reference gap between them.
///
/// \param[in] refBeginPos Zero-indexed reference position of the first aligned base
void apath_aligned_blocks(
    const pos_t refBeginPos, const path_t& apath, std::vector<known_pos_range2>& blocks);

}  // namespace ALIGNPATH

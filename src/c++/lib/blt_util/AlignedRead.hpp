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

#include "blt_util/align_path.hpp"
#include "blt_util/known_pos_range2.hpp"

#include <iosfwd>
#include <vector>

/// \brief Fixed-shape alignment record used for read pair evaluation
///
/// Alignment information is typically processed from a BAM alignment record, but may come from other sources
struct AlignedRead {
  /// \return Reference range from the first to the last aligned base, right open
  known_pos_range2 refRange() const { return known_pos_range2(beginPos, endPos); }

  /// chromosome index of the read, for unmapped reads this is the placement index (if any)
  int32_t tid = -1;

  /// zero-indexed reference start position
  pos_t beginPos = 0;

  /// zero-indexed reference position following the last aligned base, equal to beginPos when the read has no
  /// alignment path
  pos_t endPos = 0;

  /// reference ranges of all gap-free aligned segments, in order
  std::vector<known_pos_range2> blocks;

  ALIGNPATH::path_t path;

  unsigned mapq = 0;

  /// edit distance from the NM tag, only valid if isEditDistanceSet is true
  unsigned editDistance      = 0;
  bool     isEditDistanceSet = false;

  /// read length excluding soft and hard clipped segments
  unsigned readLength = 0;

  /// signed template length
  int32_t templateSize = 0;

  /// 1 or 2
  int readNo = 1;

  bool isUnmapped      = false;
  bool isMateUnmapped  = false;
  bool isReverse       = false;
  bool isSecondary     = false;
  bool isSupplementary = false;
};

std::ostream& operator<<(std::ostream& os, const AlignedRead& read);

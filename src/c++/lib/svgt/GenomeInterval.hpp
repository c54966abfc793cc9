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
#include "htsapi/bam_header_info.hpp"

#include <iosfwd>

/// \brief GenomeInterval identifies a contiguous chromosomal region.
///
/// All internal locations use a chromosome index number, taken from the chromosome table of the first
/// alignment file.
struct GenomeInterval {
  GenomeInterval(const int32_t initTid = 0, const pos_t beginPos = 0, const pos_t endPos = 0)
    : tid(initTid), range(beginPos, endPos)
  {
  }

  bool operator<(const GenomeInterval& rhs) const
  {
    if (tid < rhs.tid) return true;
    if (tid == rhs.tid) {
      return (range < rhs.range);
    }
    return false;
  }

  bool operator==(const GenomeInterval& rhs) const { return ((tid == rhs.tid) && (range == rhs.range)); }

  /// \brief chromosome index
  int32_t tid;
  /// \brief chromosome interval range
  known_pos_range2 range;
};

/// Pretty print summary information from a genome interval for end-user messages
void summarizeGenomeInterval(const bam_header_info& bamHeader, const GenomeInterval& gi, std::ostream& os);

/// Debug printer for genome interval
std::ostream& operator<<(std::ostream& os, const GenomeInterval& gi);

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

#include "svgt/GenomeInterval.hpp"

#include <vector>

/// \brief Expand each interval by \p padding on both sides, clamped to its chromosome bounds, then reduce
/// the intervals to the minimum sorted non-overlapping set
///
/// Book-ended intervals are merged together with overlapping intervals.
///
/// \param[in] bamHeader Chromosome length table used to clamp padded intervals
std::vector<GenomeInterval> padAndMergeIntervals(
    const std::vector<GenomeInterval>& intervals, const pos_t padding, const bam_header_info& bamHeader);

/// \brief Sort intervals and merge any overlapping or book-ended members in place
void mergeIntervals(std::vector<GenomeInterval>& intervals);

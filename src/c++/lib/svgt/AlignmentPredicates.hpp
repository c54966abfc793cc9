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
/// Tests of single aligned reads and read pairs against breakpoint intervals
///

#pragma once

#include "blt_util/AlignedRead.hpp"
#include "svgt/GenomeInterval.hpp"
#include "svgt/InsertSizeStats.hpp"
#include "svgt/ReadPair.hpp"

#include <vector>

/// \brief Test if a read is mapped at its best location in the reference
///
/// A read is perfectly mapped if it is mapped and either:
/// 1. MAPQ is greater than zero and the edit distance is no more than ceil(maxErrorRate * read length)
/// 2. The alignment is a single match segment covering the full read length with zero edit distance
///
/// The edit distance is only required in the cases where it is evaluated, a missing NM tag is an error in
/// these cases.
bool hasPerfectMapping(const AlignedRead& read, const double maxErrorRate);

/// \brief Test if a mapped read starts at or before the region start and ends at or after the region end
bool spansRegion(const AlignedRead& read, const GenomeInterval& region);

/// \brief Test if more than one gap-free aligned block of the read overlaps the region
bool hasGapsInRegion(const AlignedRead& read, const GenomeInterval& region);

/// \brief Test if a complete pair starts before the first region and ends after the last region
///
/// Either read may overlap a region.
bool pairSpansRegions(const ReadPair& pair, const std::vector<GenomeInterval>& regions);

/// \brief Test if a perfectly mapped read is soft-clipped at an edge of the region
///
/// Two cases are possible:
/// 1. The read ends at the region start and its last segment is a soft-clip
/// 2. The read starts one base after the region end and its first segment is a soft-clip
bool softClipsAtBreakpoint(const AlignedRead& read, const GenomeInterval& region, const double maxErrorRate);

/// \brief Test if a read lies entirely before the first region start or entirely after the last region end
bool mapsOutsideRegions(const AlignedRead& read, const std::vector<GenomeInterval>& regions);

/// \brief Test if the absolute template size of the read is within the sample's proper insert size range
///
/// This is always false when the insert size statistics are undefined.
bool isProperPair(const AlignedRead& read, const InsertSizeStats& stats);

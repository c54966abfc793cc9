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

#include "svgt/AlignmentPredicates.hpp"
#include "common/Exceptions.hpp"

#include <cassert>
#include <cmath>
#include <cstdlib>

#include <sstream>

static unsigned getEditDistance(const AlignedRead& read)
{
  if (!read.isEditDistanceSet) {
    std::ostringstream oss;
    oss << "Read is missing the required NM tag. " << read;
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }
  return read.editDistance;
}

bool hasPerfectMapping(const AlignedRead& read, const double maxErrorRate)
{
  using namespace ALIGNPATH;

  if (read.isUnmapped) return false;

  if (read.mapq > 0) {
    const double maxEditDistance(std::ceil(maxErrorRate * read.readLength));
    if (getEditDistance(read) <= maxEditDistance) return true;
  }

  const bool isFullLengthMatch(
      (read.path.size() == 1) && (read.path[0].type == MATCH) && (read.path[0].length == read.readLength));
  return (isFullLengthMatch && (getEditDistance(read) == 0));
}

bool spansRegion(const AlignedRead& read, const GenomeInterval& region)
{
  if (read.isUnmapped) return false;
  return read.refRange().is_superset_of(region.range);
}

bool hasGapsInRegion(const AlignedRead& read, const GenomeInterval& region)
{
  if (region.range.size() == 0) return false;

  unsigned overlapCount(0);
  for (const known_pos_range2& block : read.blocks) {
    if (block.is_range_intersect(region.range)) overlapCount++;
  }
  return (overlapCount > 1);
}

bool pairSpansRegions(const ReadPair& pair, const std::vector<GenomeInterval>& regions)
{
  assert(!regions.empty());
  if (!pair.isComplete()) return false;
  return (
      (pair[0].beginPos < regions.front().range.begin_pos()) &&
      (pair[1].endPos > regions.back().range.end_pos()));
}

bool softClipsAtBreakpoint(const AlignedRead& read, const GenomeInterval& region, const double maxErrorRate)
{
  using namespace ALIGNPATH;

  if (!hasPerfectMapping(read, maxErrorRate)) return false;
  return (
      ((read.endPos == region.range.begin_pos()) && is_trailing_soft_clip(read.path)) ||
      ((read.beginPos == (region.range.end_pos() + 1)) && is_leading_soft_clip(read.path)));
}

bool mapsOutsideRegions(const AlignedRead& read, const std::vector<GenomeInterval>& regions)
{
  assert(!regions.empty());
  const pos_t firstBegin(regions.front().range.begin_pos());
  const pos_t lastEnd(regions.back().range.end_pos());
  return (
      ((read.beginPos < firstBegin) && (read.endPos < firstBegin)) ||
      ((read.beginPos > lastEnd) && (read.endPos > lastEnd)));
}

bool isProperPair(const AlignedRead& read, const InsertSizeStats& stats)
{
  return stats.isProperInsertSize(std::abs(read.templateSize));
}

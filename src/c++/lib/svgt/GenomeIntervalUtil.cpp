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

#include "svgt/GenomeIntervalUtil.hpp"
#include "common/Exceptions.hpp"

#include <algorithm>
#include <sstream>

void mergeIntervals(std::vector<GenomeInterval>& intervals)
{
  if (intervals.empty()) return;

  std::sort(intervals.begin(), intervals.end());

  std::vector<GenomeInterval> merged;
  merged.push_back(intervals.front());
  const unsigned intervalCount(intervals.size());
  for (unsigned intervalIndex(1); intervalIndex < intervalCount; ++intervalIndex) {
    const GenomeInterval& interval(intervals[intervalIndex]);
    GenomeInterval&       head(merged.back());
    if ((head.tid == interval.tid) && is_intersect_window(head.range, interval.range, 1)) {
      head.range.merge_range(interval.range);
    } else {
      merged.push_back(interval);
    }
  }
  intervals.swap(merged);
}

std::vector<GenomeInterval> padAndMergeIntervals(
    const std::vector<GenomeInterval>& intervals, const pos_t padding, const bam_header_info& bamHeader)
{
  std::vector<GenomeInterval> padded(intervals);
  for (GenomeInterval& interval : padded) {
    if ((interval.tid < 0) || (interval.tid >= static_cast<int32_t>(bamHeader.chrom_data.size()))) {
      std::ostringstream oss;
      oss << "Can't pad interval with unknown chromosome index: " << interval;
      BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
    }
    interval.range.expandBy(padding);
    interval.range.clampTo(static_cast<pos_t>(bamHeader.chrom_data[interval.tid].length));
  }
  mergeIntervals(padded);
  return padded;
}

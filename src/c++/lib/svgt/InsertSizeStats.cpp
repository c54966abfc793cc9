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

#include "svgt/InsertSizeStats.hpp"
#include "blt_util/log.hpp"
#include "blt_util/stat_util.hpp"
#include "common/Exceptions.hpp"
#include "htsapi/AlignedRead_bam_util.hpp"
#include "htsapi/bam_streamer.hpp"
#include "svgt/AlignmentPredicates.hpp"

#include <iostream>
#include <sstream>

std::ostream& operator<<(std::ostream& os, const InsertSizeStats& stats)
{
  os << "InsertSizeStats: observations: " << stats.observationCount;
  if (stats.isDefined()) {
    os << " median: " << stats.median << " sd: " << stats.sd << " thresholds: [" << stats.lowerThreshold
       << "," << stats.upperThreshold << "]";
  } else {
    os << " undefined";
  }
  return os;
}

InsertSizeStats computeInsertSizeStats(const std::vector<int>& insertSizes, const double deviationFactor)
{
  InsertSizeStats stats;
  stats.observationCount = insertSizes.size();
  if (!stats.isDefined()) return stats;

  stats.median         = getMedian(insertSizes);
  stats.sd             = getPopulationStdDev(insertSizes);
  stats.lowerThreshold = static_cast<int>(stats.median - (deviationFactor * stats.sd));
  stats.upperThreshold = static_cast<int>(stats.median + (deviationFactor * stats.sd));
  return stats;
}

void getControlRegionInsertSizes(
    bam_streamer&                    bamStream,
    const ControlRegion&             region,
    const ReadPairClassifierOptions& opt,
    std::vector<int>&                insertSizes)
{
  const int32_t tid(bamStream.target_name_to_id(region.chrom.c_str()));
  if (tid < 0) {
    std::ostringstream oss;
    oss << "Control region chromosome '" << region.chrom << "' is not found in alignment file '"
        << bamStream.name() << "'";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }

  bamStream.resetRegion(tid, region.range.begin_pos(), region.range.end_pos());

  AlignedRead read;
  while (bamStream.next()) {
    const bam_record& bamRead(*(bamStream.get_record_ptr()));
    getAlignedRead(bamRead, read);
    if (!hasPerfectMapping(read, opt.maxErrorRate)) continue;
    if (read.isMateUnmapped) continue;
    if ((read.templateSize < 0) || (read.templateSize > opt.maxControlInsertSize)) continue;
    insertSizes.push_back(read.templateSize);
  }
}

InsertSizeStats estimateInsertSizeStats(
    bam_streamer&                     bamStream,
    const std::vector<ControlRegion>& controlRegions,
    const ReadPairClassifierOptions&  opt)
{
  std::vector<int> insertSizes;
  for (const ControlRegion& region : controlRegions) {
    getControlRegionInsertSizes(bamStream, region, opt, insertSizes);
  }

  const InsertSizeStats stats(computeInsertSizeStats(insertSizes, opt.insertSizeDeviationFactor));
  if (stats.isDefined()) {
    log_os << "INFO: Insert size observations at copy number 2 regions for '" << bamStream.name()
           << "': " << stats.observationCount << "\n";
    log_os << "INFO: Median insert size at copy number 2 regions for '" << bamStream.name()
           << "': " << stats.median << "\n";
    log_os << "INFO: Standard deviation of insert size at copy number 2 regions for '" << bamStream.name()
           << "': " << stats.sd << "\n";
  } else {
    log_os << "WARNING: No insert size observations at copy number 2 regions for '" << bamStream.name()
           << "'. No read pair will be treated as proper and breakpoints will not be padded for this "
              "sample.\n";
  }
  return stats;
}

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

#include "options/ReadPairClassifierOptions.hpp"
#include "svgt/ControlRegion.hpp"

#include <iosfwd>
#include <vector>

struct bam_streamer;

/// \brief Insert size statistics of one sample, estimated from copy number 2 control regions
///
/// The statistics are undefined when no observations were found, in which case no read pair is treated as
/// proper, and both insert size threshold comparisons of the classification rules evaluate false.
struct InsertSizeStats {
  bool isDefined() const { return (observationCount > 0); }

  /// \brief Padding applied to breakpoint intervals before fetching reads, zero when undefined
  pos_t getBreakpointPadding() const { return (isDefined() ? static_cast<pos_t>(median) : 0); }

  /// \return True if the statistics are defined and lowerThreshold <= size <= upperThreshold
  bool isProperInsertSize(const int size) const
  {
    return (isDefined() && (lowerThreshold <= size) && (size <= upperThreshold));
  }

  /// \return True if the statistics are defined and size < lowerThreshold
  bool isBelowLowerThreshold(const int size) const { return (isDefined() && (size < lowerThreshold)); }

  /// \return True if the statistics are defined and size > upperThreshold
  bool isAboveUpperThreshold(const int size) const { return (isDefined() && (size > upperThreshold)); }

  unsigned observationCount = 0;
  /// median insert size
  double median = 0;
  /// population standard deviation of the insert size
  double sd = 0;
  int    lowerThreshold = 0;
  int    upperThreshold = 0;
};

std::ostream& operator<<(std::ostream& os, const InsertSizeStats& stats);

/// \brief Compute statistics from a set of insert size observations
///
/// Thresholds are the median +/- deviationFactor * sd, truncated toward zero.
InsertSizeStats computeInsertSizeStats(const std::vector<int>& insertSizes, const double deviationFactor);

/// \brief Append the template size of every read in \p region which qualifies for insert size estimation
///
/// A read qualifies if it is perfectly mapped, its mate is mapped and 0 <= template size <=
/// maxControlInsertSize.
void getControlRegionInsertSizes(
    bam_streamer&                    bamStream,
    const ControlRegion&             region,
    const ReadPairClassifierOptions& opt,
    std::vector<int>&                insertSizes);

/// \brief Estimate insert size statistics from all control regions
///
/// A read overlapping several regions is counted once for each region.
InsertSizeStats estimateInsertSizeStats(
    bam_streamer&                     bamStream,
    const std::vector<ControlRegion>& controlRegions,
    const ReadPairClassifierOptions&  opt);

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

/// \brief Reference region with an empirical copy number, used to estimate baseline insert size statistics
struct ControlRegion {
  bool isCopyNumberTwo() const { return (copyNumberLabel == "2"); }

  std::string      chrom;
  known_pos_range2 range;
  /// copy number as given in the input
  std::string copyNumberLabel;
};

std::ostream& operator<<(std::ostream& os, const ControlRegion& region);

/// \brief Read control regions from a BED file with the copy number in column 4
///
/// Any row with fewer than four columns or with a non-integer position is an error.
void readControlRegions(std::istream& is, std::vector<ControlRegion>& regions);

/// \brief Copy the regions with copy number label exactly "2" from \p regions to \p copyTwoRegions
void getCopyNumberTwoRegions(
    const std::vector<ControlRegion>& regions, std::vector<ControlRegion>& copyTwoRegions);

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

/// Parameters of read pair classification and of the insert size estimation it depends on
struct ReadPairClassifierOptions {
  /// \brief Maximum fraction of edit distance over read length for a read with nonzero MAPQ to be treated
  /// as perfectly mapped
  ///
  /// The default allows at most 2 mismatches in a 100 base read.
  double maxErrorRate = 0.02;

  /// \brief Proper pair insert size thresholds are the median insert size +/- this factor times the insert
  /// size standard deviation
  double insertSizeDeviationFactor = 1.5;

  /// \brief Control region reads with a template length above this value are excluded from insert size
  /// estimation
  int maxControlInsertSize = 1000;
};

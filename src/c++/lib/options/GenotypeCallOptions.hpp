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

struct GenotypeCallOptions {
  /// \brief When both concordant and discordant pair counts are below this value no genotype is called
  unsigned homozygousDeletionThreshold = 5;

  /// \brief Genotype likelihoods are capped at this Phred score, which is also reported when the
  /// likelihood saturates
  unsigned maxPhredLikelihood = 9999;
};

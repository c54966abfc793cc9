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
/// Genotype calls from concordant and discordant read pair counts, following the read-depth ratio model of
/// Hormozdiari et al. 2010 (Genome Research)
///

#pragma once

#include "options/GenotypeCallOptions.hpp"

#include <iosfwd>

namespace GENOTYPE {
enum index_t { HOMREF, HET, HOMALT, NOCALL };

inline const char* label(const index_t id)
{
  switch (id) {
  case HOMREF:
    return "0/0";
  case HET:
    return "1/0";
  case HOMALT:
    return "1/1";
  default:
    return "./.";
  }
}
}  // namespace GENOTYPE

/// \brief Phred-scaled genotype likelihood
///
/// A likelihood is saturated when the probability term of the Phred transform is zero. Saturated
/// likelihoods, and computed likelihoods above the maximum, are reported as the maximum Phred score.
struct GenotypeLikelihood {
  enum kind_t { COMPUTED, SATURATED };

  bool isSaturated() const { return (kind == SATURATED); }

  kind_t   kind  = COMPUTED;
  unsigned value = 0;
};

struct GenotypeCall {
  GENOTYPE::index_t  genotype = GENOTYPE::NOCALL;
  GenotypeLikelihood likelihood;
};

std::ostream& operator<<(std::ostream& os, const GenotypeCall& call);

/// \brief Call a genotype from the concordant and discordant read pair counts of one SV in one sample
///
/// With T the homozygous deletion threshold, C the concordant count and D the discordant count:
/// - C < T and D < T gives no call, with likelihood -10*log10(sqrt((2^D/2^T)^2 + (2^C/2^T)^2))
/// - otherwise, with expected discordant bounds lower=C/4 and upper=4C:
///   - D < lower gives 1/1, with likelihood -10*log10(2^D/2^lower)
///   - lower <= D < upper gives 1/0, and D >= upper gives 0/0. Both use the likelihood
///     -10*log10(1-min(r,1)), r = 2^|D-upper|/2^upper
///
/// All likelihoods are rounded down. The 0/0 likelihood uses the 1/0 term unchanged.
GenotypeCall callGenotype(
    const unsigned concordant, const unsigned discordant, const GenotypeCallOptions& opt);

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

#include "svgt/GenotypeModel.hpp"

#include <cmath>

#include <iostream>

std::ostream& operator<<(std::ostream& os, const GenotypeCall& call)
{
  os << "GenotypeCall: " << GENOTYPE::label(call.genotype) << " GL: " << call.likelihood.value;
  if (call.likelihood.isSaturated()) os << " (saturated)";
  return os;
}

static GenotypeLikelihood getSaturatedLikelihood(const GenotypeCallOptions& opt)
{
  GenotypeLikelihood gl;
  gl.kind  = GenotypeLikelihood::SATURATED;
  gl.value = opt.maxPhredLikelihood;
  return gl;
}

/// round down a finite, non-negative phred value and cap it at the maximum
static GenotypeLikelihood getComputedLikelihood(const double phred, const GenotypeCallOptions& opt)
{
  GenotypeLikelihood gl;
  const double       maxPhred(opt.maxPhredLikelihood);
  const double       floorPhred(std::floor(phred));
  if ((!std::isfinite(phred)) || (floorPhred >= maxPhred)) {
    gl.value = opt.maxPhredLikelihood;
  } else if (floorPhred <= 0.) {
    // includes -0
    gl.value = 0;
  } else {
    gl.value = static_cast<unsigned>(floorPhred);
  }
  return gl;
}

/// phred scaled form of log2 value x, ie. -10*log10(2^x)
static double log2ToPhred(const double x)
{
  return (-10. * x * std::log10(2.));
}

/// the ratio of powers of two 2^a/2^b is evaluated as 2^(a-b)
static GenotypeLikelihood getNoCallLikelihood(
    const unsigned concordant, const unsigned discordant, const GenotypeCallOptions& opt)
{
  const int    threshold(opt.homozygousDeletionThreshold);
  const double discordantTerm(std::ldexp(1., 2 * (static_cast<int>(discordant) - threshold)));
  const double concordantTerm(std::ldexp(1., 2 * (static_cast<int>(concordant) - threshold)));
  const double squareSum(discordantTerm + concordantTerm);
  if (squareSum <= 0.) return getSaturatedLikelihood(opt);

  // -10*log10(sqrt(x)) == -5*log10(x)
  return getComputedLikelihood(-5. * std::log10(squareSum), opt);
}

static GenotypeLikelihood getRatioLikelihood(
    const double discordant, const double upper, const GenotypeCallOptions& opt)
{
  const double ratioExponent(std::abs(discordant - upper) - upper);
  if (ratioExponent >= 0.) return getSaturatedLikelihood(opt);

  const double complement(1. - std::pow(2., ratioExponent));
  if (complement <= 0.) return getSaturatedLikelihood(opt);
  return getComputedLikelihood(-10. * std::log10(complement), opt);
}

GenotypeCall callGenotype(
    const unsigned concordant, const unsigned discordant, const GenotypeCallOptions& opt)
{
  GenotypeCall call;

  if ((concordant < opt.homozygousDeletionThreshold) && (discordant < opt.homozygousDeletionThreshold)) {
    call.genotype   = GENOTYPE::NOCALL;
    call.likelihood = getNoCallLikelihood(concordant, discordant, opt);
    return call;
  }

  const double discordantCount(discordant);
  const double expectedDiscordantLowerBound(concordant * 0.25);
  const double expectedDiscordantUpperBound(concordant * 4.);

  if (discordantCount < expectedDiscordantLowerBound) {
    call.genotype   = GENOTYPE::HOMALT;
    call.likelihood = getComputedLikelihood(log2ToPhred(discordantCount - expectedDiscordantLowerBound), opt);
  } else if (discordantCount < expectedDiscordantUpperBound) {
    call.genotype   = GENOTYPE::HET;
    call.likelihood = getRatioLikelihood(discordantCount, expectedDiscordantUpperBound, opt);
  } else {
    call.genotype   = GENOTYPE::HOMREF;
    call.likelihood = getRatioLikelihood(discordantCount, expectedDiscordantUpperBound, opt);
  }
  return call;
}

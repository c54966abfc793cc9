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

#include "boost/test/unit_test.hpp"

#include "svgt/GenotypeModel.hpp"

BOOST_AUTO_TEST_SUITE(test_GenotypeModel)

static GenotypeCallOptions getTestOptions(const unsigned threshold = 5)
{
  GenotypeCallOptions opt;
  opt.homozygousDeletionThreshold = threshold;
  return opt;
}

static void checkComputedCall(
    const GenotypeCall& call, const GENOTYPE::index_t expectGenotype, const unsigned expectLikelihood)
{
  BOOST_REQUIRE_EQUAL(GENOTYPE::label(call.genotype), GENOTYPE::label(expectGenotype));
  BOOST_REQUIRE(!call.likelihood.isSaturated());
  BOOST_REQUIRE_EQUAL(call.likelihood.value, expectLikelihood);
}

BOOST_AUTO_TEST_CASE(test_genotype_labels)
{
  BOOST_REQUIRE_EQUAL(std::string(GENOTYPE::label(GENOTYPE::HOMREF)), "0/0");
  BOOST_REQUIRE_EQUAL(std::string(GENOTYPE::label(GENOTYPE::HET)), "1/0");
  BOOST_REQUIRE_EQUAL(std::string(GENOTYPE::label(GENOTYPE::HOMALT)), "1/1");
  BOOST_REQUIRE_EQUAL(std::string(GENOTYPE::label(GENOTYPE::NOCALL)), "./.");
}

BOOST_AUTO_TEST_CASE(test_no_call_without_support)
{
  // both terms are 2^-10, so the likelihood is -5*log10(2^-9)
  checkComputedCall(callGenotype(0, 0, getTestOptions()), GENOTYPE::NOCALL, 13);
}

BOOST_AUTO_TEST_CASE(test_no_call_below_threshold)
{
  // discordant and concordant terms are 2^-2 and 2^-8
  checkComputedCall(callGenotype(1, 4, getTestOptions()), GENOTYPE::NOCALL, 2);

  // one count at the threshold is enough to call a genotype
  const GenotypeCall call(callGenotype(4, 5, getTestOptions()));
  BOOST_REQUIRE_NE(call.genotype, GENOTYPE::NOCALL);
}

BOOST_AUTO_TEST_CASE(test_homalt)
{
  // lower bound is 2, likelihood is -10*log10(2^-1)
  checkComputedCall(callGenotype(8, 1, getTestOptions()), GENOTYPE::HOMALT, 3);

  // lower bound is 25
  checkComputedCall(callGenotype(100, 0, getTestOptions()), GENOTYPE::HOMALT, 75);
}

BOOST_AUTO_TEST_CASE(test_het)
{
  checkComputedCall(callGenotype(4, 8, getTestOptions()), GENOTYPE::HET, 0);

  // the upper bound is 16, so the ratio term is 2^15/2^16
  checkComputedCall(callGenotype(4, 1, getTestOptions(1)), GENOTYPE::HET, 3);
}

BOOST_AUTO_TEST_CASE(test_homref)
{
  checkComputedCall(callGenotype(4, 20, getTestOptions()), GENOTYPE::HOMREF, 0);

  // the ratio term is 2^-1
  checkComputedCall(callGenotype(5, 39, getTestOptions()), GENOTYPE::HOMREF, 3);
}

BOOST_AUTO_TEST_CASE(test_expected_discordant_bounds)
{
  // with a threshold of one a concordant count of four is always called, and the expected discordant range
  // is [1,16)
  const GenotypeCallOptions opt(getTestOptions(1));
  BOOST_REQUIRE_EQUAL(callGenotype(4, 0, opt).genotype, GENOTYPE::HOMALT);
  BOOST_REQUIRE_EQUAL(callGenotype(4, 1, opt).genotype, GENOTYPE::HET);
  BOOST_REQUIRE_EQUAL(callGenotype(4, 15, opt).genotype, GENOTYPE::HET);
  BOOST_REQUIRE_EQUAL(callGenotype(4, 16, opt).genotype, GENOTYPE::HOMREF);
}

BOOST_AUTO_TEST_CASE(test_saturated_likelihood)
{
  const GenotypeCallOptions opt(getTestOptions());

  // no concordant support makes the ratio term 2^10/2^0
  const GenotypeCall call(callGenotype(0, 10, opt));
  BOOST_REQUIRE_EQUAL(call.genotype, GENOTYPE::HOMREF);
  BOOST_REQUIRE(call.likelihood.isSaturated());
  BOOST_REQUIRE_EQUAL(call.likelihood.value, opt.maxPhredLikelihood);

  // ratio term is exactly one
  const GenotypeCall call2(callGenotype(5, 40, opt));
  BOOST_REQUIRE_EQUAL(call2.genotype, GENOTYPE::HOMREF);
  BOOST_REQUIRE(call2.likelihood.isSaturated());
  BOOST_REQUIRE_EQUAL(call2.likelihood.value, opt.maxPhredLikelihood);
}

BOOST_AUTO_TEST_CASE(test_likelihood_cap)
{
  GenotypeCallOptions opt(getTestOptions());
  opt.maxPhredLikelihood = 50;

  const GenotypeCall call(callGenotype(100, 0, opt));
  BOOST_REQUIRE_EQUAL(call.genotype, GENOTYPE::HOMALT);
  BOOST_REQUIRE(!call.likelihood.isSaturated());
  BOOST_REQUIRE_EQUAL(call.likelihood.value, 50u);
}

BOOST_AUTO_TEST_SUITE_END()

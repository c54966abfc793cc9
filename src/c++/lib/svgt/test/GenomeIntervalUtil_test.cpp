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

#include "svgt/GenomeIntervalUtil.hpp"
#include "test/testAlignmentDataUtil.hpp"

BOOST_AUTO_TEST_SUITE(test_GenomeIntervalUtil)

BOOST_AUTO_TEST_CASE(test_mergeIntervals)
{
  std::vector<GenomeInterval> intervals = {GenomeInterval(1, 10, 20),
                                           GenomeInterval(0, 50, 60),
                                           GenomeInterval(0, 10, 20),
                                           GenomeInterval(0, 15, 30),
                                           GenomeInterval(0, 30, 40)};
  mergeIntervals(intervals);

  // overlapping and book-ended intervals are merged, chromosomes are kept apart
  BOOST_REQUIRE_EQUAL(intervals.size(), 3u);
  BOOST_REQUIRE_EQUAL(intervals[0], GenomeInterval(0, 10, 40));
  BOOST_REQUIRE_EQUAL(intervals[1], GenomeInterval(0, 50, 60));
  BOOST_REQUIRE_EQUAL(intervals[2], GenomeInterval(1, 10, 20));
}

BOOST_AUTO_TEST_CASE(test_mergeIntervals_empty)
{
  std::vector<GenomeInterval> intervals;
  mergeIntervals(intervals);
  BOOST_REQUIRE(intervals.empty());
}

BOOST_AUTO_TEST_CASE(test_padAndMergeIntervals)
{
  const bam_header_info bamHeader(buildTestBamHeader());

  // the two insertion breakpoints are merged after padding
  const std::vector<GenomeInterval> breakpoints = {GenomeInterval(0, 1000, 1001),
                                                   GenomeInterval(0, 1400, 1401)};
  const std::vector<GenomeInterval> padded(padAndMergeIntervals(breakpoints, 300, bamHeader));
  BOOST_REQUIRE_EQUAL(padded.size(), 1u);
  BOOST_REQUIRE_EQUAL(padded[0], GenomeInterval(0, 700, 1701));

  const std::vector<GenomeInterval> unmerged(padAndMergeIntervals(breakpoints, 100, bamHeader));
  BOOST_REQUIRE_EQUAL(unmerged.size(), 2u);
  BOOST_REQUIRE_EQUAL(unmerged[0], GenomeInterval(0, 900, 1101));
  BOOST_REQUIRE_EQUAL(unmerged[1], GenomeInterval(0, 1300, 1501));
}

BOOST_AUTO_TEST_CASE(test_padAndMergeIntervals_clamp)
{
  const bam_header_info bamHeader(buildTestBamHeader());

  const std::vector<GenomeInterval> breakpoints = {GenomeInterval(1, 50, 51), GenomeInterval(1, 4950, 4951)};
  const std::vector<GenomeInterval> padded(padAndMergeIntervals(breakpoints, 100, bamHeader));
  BOOST_REQUIRE_EQUAL(padded.size(), 2u);
  BOOST_REQUIRE_EQUAL(padded[0], GenomeInterval(1, 0, 151));
  BOOST_REQUIRE_EQUAL(padded[1], GenomeInterval(1, 4850, 5000));
}

BOOST_AUTO_TEST_CASE(test_padAndMergeIntervals_bad_chrom)
{
  const bam_header_info             bamHeader(buildTestBamHeader());
  const std::vector<GenomeInterval> breakpoints = {GenomeInterval(2, 50, 51)};
  BOOST_REQUIRE_THROW(padAndMergeIntervals(breakpoints, 100, bamHeader), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()

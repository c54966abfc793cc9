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

#include "svgt/AlignmentPredicates.hpp"
#include "test/testAlignmentDataUtil.hpp"

BOOST_AUTO_TEST_SUITE(test_AlignmentPredicates)

static const double maxErrorRate(0.02);

BOOST_AUTO_TEST_CASE(test_hasPerfectMapping)
{
  // two mismatches in a 100 base read are tolerated with nonzero MAPQ
  BOOST_REQUIRE(hasPerfectMapping(buildTestAlignedRead(100, "100M", false, 2), maxErrorRate));
  BOOST_REQUIRE(!hasPerfectMapping(buildTestAlignedRead(100, "100M", false, 3), maxErrorRate));

  // the tolerance is computed from the aligned read length
  BOOST_REQUIRE(!hasPerfectMapping(buildTestAlignedRead(100, "50S50M", false, 2), maxErrorRate));
  BOOST_REQUIRE(hasPerfectMapping(buildTestAlignedRead(100, "50S50M", false, 1), maxErrorRate));
}

BOOST_AUTO_TEST_CASE(test_hasPerfectMapping_zero_mapq)
{
  // a full length exact match is accepted at MAPQ 0
  BOOST_REQUIRE(hasPerfectMapping(buildTestAlignedRead(100, "100M", false, 0, 0), maxErrorRate));
  BOOST_REQUIRE(!hasPerfectMapping(buildTestAlignedRead(100, "100M", false, 1, 0), maxErrorRate));
  BOOST_REQUIRE(!hasPerfectMapping(buildTestAlignedRead(100, "10S90M", false, 0, 0), maxErrorRate));
}

BOOST_AUTO_TEST_CASE(test_hasPerfectMapping_unmapped)
{
  AlignedRead read(buildTestAlignedRead(100, "100M"));
  read.isUnmapped = true;
  BOOST_REQUIRE(!hasPerfectMapping(read, maxErrorRate));

  // the edit distance of an unmapped read is never needed
  read.isEditDistanceSet = false;
  BOOST_REQUIRE(!hasPerfectMapping(read, maxErrorRate));
}

BOOST_AUTO_TEST_CASE(test_hasPerfectMapping_missing_edit_distance)
{
  const AlignedRead read(buildTestAlignedRead(100, "100M", false, -1));
  BOOST_REQUIRE_THROW(hasPerfectMapping(read, maxErrorRate), std::exception);
}

BOOST_AUTO_TEST_CASE(test_spansRegion)
{
  const AlignedRead read(buildTestAlignedRead(100, "100M"));
  BOOST_REQUIRE(spansRegion(read, GenomeInterval(0, 100, 200)));
  BOOST_REQUIRE(spansRegion(read, GenomeInterval(0, 150, 151)));
  BOOST_REQUIRE(!spansRegion(read, GenomeInterval(0, 99, 150)));
  BOOST_REQUIRE(!spansRegion(read, GenomeInterval(0, 150, 201)));

  AlignedRead unmapped(read);
  unmapped.isUnmapped = true;
  BOOST_REQUIRE(!spansRegion(unmapped, GenomeInterval(0, 150, 151)));
}

BOOST_AUTO_TEST_CASE(test_spansRegion_subinterval)
{
  // a read spanning a region spans every subinterval of it
  const AlignedRead    read(buildTestAlignedRead(100, "30M5D70M"));
  const GenomeInterval region(0, 110, 190);
  BOOST_REQUIRE(spansRegion(read, region));
  for (pos_t begin(region.range.begin_pos()); begin < region.range.end_pos(); begin += 7) {
    for (pos_t end(begin); end <= region.range.end_pos(); end += 5) {
      BOOST_REQUIRE(spansRegion(read, GenomeInterval(0, begin, end)));
    }
  }
}

BOOST_AUTO_TEST_CASE(test_hasGapsInRegion)
{
  // blocks are [100,130) and [140,210)
  const AlignedRead read(buildTestAlignedRead(100, "30M10D70M"));
  BOOST_REQUIRE(hasGapsInRegion(read, GenomeInterval(0, 120, 150)));
  BOOST_REQUIRE(!hasGapsInRegion(read, GenomeInterval(0, 100, 130)));
  BOOST_REQUIRE(!hasGapsInRegion(read, GenomeInterval(0, 130, 140)));
  BOOST_REQUIRE(!hasGapsInRegion(read, GenomeInterval(0, 150, 200)));

  // an empty region overlaps no block
  BOOST_REQUIRE(!hasGapsInRegion(read, GenomeInterval(0, 129, 129)));

  // an insertion splits blocks
  const AlignedRead insRead(buildTestAlignedRead(100, "50M20I30M"));
  BOOST_REQUIRE(hasGapsInRegion(insRead, GenomeInterval(0, 140, 160)));

  const AlignedRead noGapRead(buildTestAlignedRead(100, "10S50=1X39=10S"));
  BOOST_REQUIRE(!hasGapsInRegion(noGapRead, GenomeInterval(0, 100, 190)));
}

BOOST_AUTO_TEST_CASE(test_pairSpansRegions)
{
  const std::vector<GenomeInterval> regions = {GenomeInterval(0, 500, 501), GenomeInterval(0, 600, 601)};

  const ReadPair pair(buildTestAlignedRead(300, "100M"), buildTestAlignedRead(700, "100M", true));
  BOOST_REQUIRE(pairSpansRegions(pair, regions));

  const ReadPair leftOverlap(buildTestAlignedRead(500, "100M"), buildTestAlignedRead(700, "100M", true));
  BOOST_REQUIRE(!pairSpansRegions(leftOverlap, regions));

  const ReadPair rightShort(buildTestAlignedRead(300, "100M"), buildTestAlignedRead(450, "151M", true));
  BOOST_REQUIRE(!pairSpansRegions(rightShort, regions));

  const ReadPair single(buildTestAlignedRead(300, "100M"));
  BOOST_REQUIRE(!pairSpansRegions(single, regions));
}

BOOST_AUTO_TEST_CASE(test_softClipsAtBreakpoint)
{
  const GenomeInterval breakpoint(0, 500, 501);

  // read ends at the breakpoint start with a trailing clip
  BOOST_REQUIRE(softClipsAtBreakpoint(buildTestAlignedRead(410, "90M10S"), breakpoint, maxErrorRate));
  BOOST_REQUIRE(!softClipsAtBreakpoint(buildTestAlignedRead(410, "90M"), breakpoint, maxErrorRate));
  BOOST_REQUIRE(!softClipsAtBreakpoint(buildTestAlignedRead(411, "90M10S"), breakpoint, maxErrorRate));

  // read starts one past the breakpoint end with a leading clip
  BOOST_REQUIRE(softClipsAtBreakpoint(buildTestAlignedRead(502, "10S90M"), breakpoint, maxErrorRate));
  BOOST_REQUIRE(!softClipsAtBreakpoint(buildTestAlignedRead(501, "10S90M"), breakpoint, maxErrorRate));

  // imperfect mappings never count
  BOOST_REQUIRE(
      !softClipsAtBreakpoint(buildTestAlignedRead(410, "90M10S", false, 5), breakpoint, maxErrorRate));
}

BOOST_AUTO_TEST_CASE(test_mapsOutsideRegions)
{
  const std::vector<GenomeInterval> regions = {GenomeInterval(0, 500, 501), GenomeInterval(0, 600, 601)};

  BOOST_REQUIRE(mapsOutsideRegions(buildTestAlignedRead(300, "100M"), regions));
  BOOST_REQUIRE(mapsOutsideRegions(buildTestAlignedRead(700, "100M"), regions));
  BOOST_REQUIRE(!mapsOutsideRegions(buildTestAlignedRead(450, "100M"), regions));
  BOOST_REQUIRE(!mapsOutsideRegions(buildTestAlignedRead(520, "50M"), regions));

  // touching the first breakpoint start is not outside
  BOOST_REQUIRE(!mapsOutsideRegions(buildTestAlignedRead(400, "100M"), regions));
}

BOOST_AUTO_TEST_CASE(test_isProperPair)
{
  const InsertSizeStats stats(computeInsertSizeStats({300, 300, 320, 280}, 1.5));
  BOOST_REQUIRE_EQUAL(stats.lowerThreshold, 278);
  BOOST_REQUIRE_EQUAL(stats.upperThreshold, 321);

  BOOST_REQUIRE(isProperPair(buildTestAlignedRead(100, "100M", false, 0, 60, 300), stats));
  BOOST_REQUIRE(isProperPair(buildTestAlignedRead(100, "100M", true, 0, 60, -300), stats));
  BOOST_REQUIRE(!isProperPair(buildTestAlignedRead(100, "100M", false, 0, 60, 400), stats));

  // no read pair is proper with undefined statistics
  BOOST_REQUIRE(!isProperPair(buildTestAlignedRead(100, "100M", false, 0, 60, 300), InsertSizeStats()));
}

BOOST_AUTO_TEST_SUITE_END()

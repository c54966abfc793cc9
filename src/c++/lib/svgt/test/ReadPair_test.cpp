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

#include "svgt/ReadPair.hpp"
#include "test/testAlignmentDataUtil.hpp"

BOOST_AUTO_TEST_SUITE(test_ReadPair)

BOOST_AUTO_TEST_CASE(test_ReadPair_position_order)
{
  AlignedRead read1(buildTestAlignedRead(500, "100M", true));
  read1.readNo = 1;
  AlignedRead read2(buildTestAlignedRead(200, "100M"));
  read2.readNo = 2;

  const ReadPair pair(read1, read2);
  BOOST_REQUIRE(pair.isComplete());
  BOOST_REQUIRE_EQUAL(pair[0].beginPos, 200);
  BOOST_REQUIRE_EQUAL(pair[0].readNo, 2);
  BOOST_REQUIRE_EQUAL(pair[1].beginPos, 500);
  BOOST_REQUIRE_EQUAL(pair.front().readNo, 2);
  BOOST_REQUIRE_EQUAL(pair.back().readNo, 1);
}

BOOST_AUTO_TEST_CASE(test_ReadPair_same_position_order)
{
  AlignedRead mapped(buildTestAlignedRead(500, "100M"));
  mapped.readNo = 2;
  AlignedRead unmapped(buildTestAlignedRead(500, "100M"));
  unmapped.readNo     = 1;
  unmapped.isUnmapped = true;

  // mapped reads come first at the same position
  const ReadPair pair(unmapped, mapped);
  BOOST_REQUIRE(!pair[0].isUnmapped);
  BOOST_REQUIRE(pair[1].isUnmapped);

  // followed by read number
  AlignedRead mapped1(mapped);
  mapped1.readNo = 1;
  const ReadPair pair2(mapped, mapped1);
  BOOST_REQUIRE_EQUAL(pair2[0].readNo, 1);
  BOOST_REQUIRE_EQUAL(pair2[1].readNo, 2);
}

BOOST_AUTO_TEST_CASE(test_ReadPair_max_size)
{
  ReadPair pair;
  BOOST_REQUIRE_EQUAL(pair.size(), 0u);
  pair.addRead(buildTestAlignedRead(100, "100M"));
  BOOST_REQUIRE_EQUAL(pair.size(), 1u);
  BOOST_REQUIRE(!pair.isComplete());
  pair.addRead(buildTestAlignedRead(300, "100M", true));
  BOOST_REQUIRE_THROW(pair.addRead(buildTestAlignedRead(400, "100M")), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()

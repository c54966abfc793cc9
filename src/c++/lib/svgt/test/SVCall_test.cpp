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

#include "svgt/SVCall.hpp"
#include "test/testAlignmentDataUtil.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(test_SVCall)

BOOST_AUTO_TEST_CASE(test_readSVCalls)
{
  std::istringstream iss(
      "#chrom\tstart\tend\ttype\tlength\tcontig\tcontig_start\tcontig_end\n"
      "chr1\t350793\t350794\tinsertion\t40\tchrFoo\t37\t77\n"
      "\n"
      "chr2\t1000\t1500\tdeletion\t500\tchrBar\t200\t700\textra\n"
      "chr3\t10\t20\tinversion\t10\tchrBar\t5\t15\n");

  std::vector<SVCall> svCalls;
  readSVCalls(iss, svCalls);

  BOOST_REQUIRE_EQUAL(svCalls.size(), 3u);
  BOOST_REQUIRE_EQUAL(svCalls[0].chrom, "chr1");
  BOOST_REQUIRE_EQUAL(svCalls[0].start, 350793);
  BOOST_REQUIRE_EQUAL(svCalls[0].end, 350794);
  BOOST_REQUIRE_EQUAL(svCalls[0].eventType, SV_EVENT::INSERTION);
  BOOST_REQUIRE_EQUAL(svCalls[0].eventLabel, "insertion");
  BOOST_REQUIRE_EQUAL(svCalls[0].eventLength, 40);
  BOOST_REQUIRE_EQUAL(svCalls[0].contigName, "chrFoo");
  BOOST_REQUIRE_EQUAL(svCalls[0].contigStart, 37);
  BOOST_REQUIRE_EQUAL(svCalls[0].contigEnd, 77);

  BOOST_REQUIRE_EQUAL(svCalls[1].eventType, SV_EVENT::DELETION);
  BOOST_REQUIRE_EQUAL(svCalls[2].eventType, SV_EVENT::OTHER);
  BOOST_REQUIRE_EQUAL(svCalls[2].eventLabel, "inversion");
}

BOOST_AUTO_TEST_CASE(test_readSVCalls_short_line)
{
  std::istringstream  iss("chr1\t350793\t350794\tinsertion\t40\tchrFoo\t37\n");
  std::vector<SVCall> svCalls;
  BOOST_REQUIRE_THROW(readSVCalls(iss, svCalls), std::exception);
}

BOOST_AUTO_TEST_CASE(test_readSVCalls_bad_position)
{
  std::istringstream  iss("chr1\t350793\t350794\tinsertion\t40\tchrFoo\tabc\t77\n");
  std::vector<SVCall> svCalls;
  BOOST_REQUIRE_THROW(readSVCalls(iss, svCalls), std::exception);
}

BOOST_AUTO_TEST_CASE(test_getBreakpointIntervals)
{
  const bam_header_info bamHeader(buildTestBamHeader());

  SVCall svCall;
  svCall.contigName  = "chrBar";
  svCall.contigStart = 200;
  svCall.contigEnd   = 700;
  svCall.eventType   = SV_EVENT::DELETION;

  std::vector<GenomeInterval> breakpoints;
  getBreakpointIntervals(svCall, bamHeader, breakpoints);
  BOOST_REQUIRE_EQUAL(breakpoints.size(), 1u);
  BOOST_REQUIRE_EQUAL(breakpoints[0], GenomeInterval(1, 200, 700));

  svCall.eventType = SV_EVENT::INSERTION;
  getBreakpointIntervals(svCall, bamHeader, breakpoints);
  BOOST_REQUIRE_EQUAL(breakpoints.size(), 2u);
  BOOST_REQUIRE_EQUAL(breakpoints[0], GenomeInterval(1, 200, 201));
  BOOST_REQUIRE_EQUAL(breakpoints[1], GenomeInterval(1, 699, 700));

  svCall.contigName = "chrMissing";
  BOOST_REQUIRE_THROW(getBreakpointIntervals(svCall, bamHeader, breakpoints), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()

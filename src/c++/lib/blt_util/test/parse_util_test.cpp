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

#include "blt_util/parse_util.hpp"

#include <string>

BOOST_AUTO_TEST_SUITE(parse_util)

using namespace svgt::blt_util;

//
// check int parsing
//
BOOST_AUTO_TEST_CASE(test_parse_int)
{
  const char* two = "2";
  const int   val(parse_int(two));
  BOOST_REQUIRE_EQUAL(val, 2);
}

BOOST_AUTO_TEST_CASE(test_parse_int_big)
{
  const char* twobig = "20000000000000000000";
  BOOST_REQUIRE_THROW(parse_int(twobig), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_small)
{
  const char* twosmall = "-20000000000000000000";
  BOOST_REQUIRE_THROW(parse_int(twosmall), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_empty)
{
  const char* empty = "";
  BOOST_REQUIRE_THROW(parse_int(empty), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_tolerate_suffix)
{
  const char* suffix = "123abc";
  const int   val(parse_int(suffix));
  BOOST_REQUIRE_EQUAL(val, 123);
  BOOST_REQUIRE_EQUAL(std::string(suffix), "abc");
}

BOOST_AUTO_TEST_CASE(test_parse_int_str)
{
  static const char two[] = "2";
  const int         val(parse_int_str(std::string(two)));
  BOOST_REQUIRE_EQUAL(val, 2);
}

BOOST_AUTO_TEST_CASE(test_parse_int_str_bad_input)
{
  static const std::string junk("ABCD");
  BOOST_REQUIRE_THROW(parse_int_str(junk), std::exception);

  // a coordinate column with a trailing suffix is not an integer
  static const std::string suffix("100bp");
  BOOST_REQUIRE_THROW(parse_int_str(suffix), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_int_rval)
{
  const int val(parse_int_rvalue("2"));
  BOOST_REQUIRE_EQUAL(val, 2);
}

//
// check long parsing
//
BOOST_AUTO_TEST_CASE(test_parse_long)
{
  const char* two = "9223372036854775807";
  const long  val(parse_long(two));
  BOOST_REQUIRE_EQUAL(val, 9223372036854775807l);
}

BOOST_AUTO_TEST_CASE(test_parse_long_big)
{
  const char* twobig = "9223372036854775808";
  BOOST_REQUIRE_THROW(parse_long(twobig), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_long_empty)
{
  const char* empty = "";
  BOOST_REQUIRE_THROW(parse_long(empty), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_long_rval)
{
  const long val(parse_long_rvalue("2"));
  BOOST_REQUIRE_EQUAL(val, 2l);
  BOOST_REQUIRE_THROW(parse_long_rvalue("2x"), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()

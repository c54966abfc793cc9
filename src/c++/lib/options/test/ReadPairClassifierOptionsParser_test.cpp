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

#include "options/ReadPairClassifierOptionsParser.hpp"

#include <vector>

BOOST_AUTO_TEST_SUITE(test_ReadPairClassifierOptionsParser)

namespace po = boost::program_options;

static bool parseTestArgs(
    const std::vector<const char*>& args, ReadPairClassifierOptions& opt, std::string& errorMsg)
{
  std::vector<const char*> argv(1, "test");
  argv.insert(argv.end(), args.begin(), args.end());

  const po::options_description desc(getOptionsDescription(opt));
  po::variables_map             vm;
  po::store(po::command_line_parser(static_cast<int>(argv.size()), argv.data()).options(desc).run(), vm);
  po::notify(vm);
  return parseOptions(vm, opt, errorMsg);
}

BOOST_AUTO_TEST_CASE(test_defaults)
{
  ReadPairClassifierOptions opt;
  std::string               errorMsg;
  BOOST_REQUIRE(!parseTestArgs({}, opt, errorMsg));
  BOOST_REQUIRE(errorMsg.empty());
  BOOST_REQUIRE_EQUAL(opt.maxErrorRate, 0.02);
  BOOST_REQUIRE_EQUAL(opt.insertSizeDeviationFactor, 1.5);
  BOOST_REQUIRE_EQUAL(opt.maxControlInsertSize, 1000);
}

BOOST_AUTO_TEST_CASE(test_set_options)
{
  ReadPairClassifierOptions opt;
  std::string               errorMsg;
  BOOST_REQUIRE(!parseTestArgs(
      {"--max-error-rate", "0.05", "--insert-size-deviations", "2", "--max-control-insert-size", "800"},
      opt,
      errorMsg));
  BOOST_REQUIRE_EQUAL(opt.maxErrorRate, 0.05);
  BOOST_REQUIRE_EQUAL(opt.insertSizeDeviationFactor, 2.);
  BOOST_REQUIRE_EQUAL(opt.maxControlInsertSize, 800);
}

BOOST_AUTO_TEST_CASE(test_invalid_options)
{
  {
    ReadPairClassifierOptions opt;
    std::string               errorMsg;
    BOOST_REQUIRE(parseTestArgs({"--max-error-rate", "1"}, opt, errorMsg));
    BOOST_REQUIRE(errorMsg.find("max-error-rate") == 0);
  }
  {
    ReadPairClassifierOptions opt;
    std::string               errorMsg;
    BOOST_REQUIRE(parseTestArgs({"--insert-size-deviations=-1"}, opt, errorMsg));
    BOOST_REQUIRE(errorMsg.find("insert-size-deviations") == 0);
  }
  {
    ReadPairClassifierOptions opt;
    std::string               errorMsg;
    BOOST_REQUIRE(parseTestArgs({"--max-control-insert-size=-5"}, opt, errorMsg));
    BOOST_REQUIRE(errorMsg.find("max-control-insert-size") == 0);
  }
}

BOOST_AUTO_TEST_SUITE_END()

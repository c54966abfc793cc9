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

#include "options/ReadPairClassifierOptionsParser.hpp"

boost::program_options::options_description getOptionsDescription(ReadPairClassifierOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("read-pair-classifier");
  // clang-format off
  desc.add_options()
  ("max-error-rate", po::value(&opt.maxErrorRate)->default_value(opt.maxErrorRate),
   "Reads with MAPQ>0 are treated as perfectly mapped if their edit distance is no more than this fraction of the read length")
  ("insert-size-deviations", po::value(&opt.insertSizeDeviationFactor)->default_value(opt.insertSizeDeviationFactor),
   "Proper pair insert size range is the control region median insert size +/- this many standard deviations")
  ("max-control-insert-size", po::value(&opt.maxControlInsertSize)->default_value(opt.maxControlInsertSize),
   "Control region read pairs with a template length above this value are excluded from insert size estimation")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& /*vm*/,
    ReadPairClassifierOptions& opt,
    std::string&               errorMsg)
{
  errorMsg.clear();
  if ((opt.maxErrorRate < 0) || (opt.maxErrorRate >= 1.0)) {
    errorMsg = "max-error-rate argument is restricted to [0,1)";
  } else if (opt.insertSizeDeviationFactor < 0) {
    errorMsg = "insert-size-deviations argument must be non-negative";
  } else if (opt.maxControlInsertSize < 0) {
    errorMsg = "max-control-insert-size argument must be non-negative";
  }

  return (!errorMsg.empty());
}

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

#include "options/GenotypeCallOptionsParser.hpp"

boost::program_options::options_description getOptionsDescription(GenotypeCallOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("genotype-call");
  // clang-format off
  desc.add_options()
  ("homozygous-deletion-threshold", po::value(&opt.homozygousDeletionThreshold)->default_value(opt.homozygousDeletionThreshold),
   "No genotype is called when both the concordant and discordant pair counts are below this value")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& /*vm*/, GenotypeCallOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();
  if (opt.homozygousDeletionThreshold == 0) {
    errorMsg = "homozygous-deletion-threshold argument must be positive";
  }

  return (!errorMsg.empty());
}

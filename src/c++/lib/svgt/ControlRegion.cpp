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

#include "svgt/ControlRegion.hpp"
#include "blt_util/blt_exception.hpp"
#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

std::ostream& operator<<(std::ostream& os, const ControlRegion& region)
{
  os << "ControlRegion: " << region.chrom << ":" << region.range << " copyNumber: " << region.copyNumberLabel;
  return os;
}

void readControlRegions(std::istream& is, std::vector<ControlRegion>& regions)
{
  using namespace svgt::blt_util;

  static const unsigned minColumnCount(4);

  regions.clear();
  istream_line_splitter dparse(is);
  while (dparse.parse_line()) {
    if (is_bed_header_or_blank(dparse)) continue;

    if (dparse.n_word() < minColumnCount) {
      std::ostringstream oss;
      oss << "Expected at least " << minColumnCount << " columns in control region input line, found "
          << dparse.n_word() << ":\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
    }

    try {
      ControlRegion region;
      region.chrom = dparse.word(0);
      region.range.set_begin_pos(parse_int_str(dparse.word(1)));
      region.range.set_end_pos(parse_int_str(dparse.word(2)));
      region.copyNumberLabel = dparse.word(3);
      regions.push_back(region);
    } catch (const blt_exception& e) {
      std::ostringstream oss;
      oss << "Invalid control region input line. " << e.what() << ":\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
    }
  }
}

void getCopyNumberTwoRegions(
    const std::vector<ControlRegion>& regions, std::vector<ControlRegion>& copyTwoRegions)
{
  copyTwoRegions.clear();
  for (const ControlRegion& region : regions) {
    if (region.isCopyNumberTwo()) copyTwoRegions.push_back(region);
  }
}

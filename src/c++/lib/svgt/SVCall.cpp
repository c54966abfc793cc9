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

#include "svgt/SVCall.hpp"
#include "blt_util/blt_exception.hpp"
#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

namespace SV_EVENT {

index_t parseLabel(const std::string& label)
{
  if (label == "insertion") return INSERTION;
  if (label == "deletion") return DELETION;
  return OTHER;
}

const char* label(const index_t id)
{
  switch (id) {
  case INSERTION:
    return "insertion";
  case DELETION:
    return "deletion";
  default:
    return "other";
  }
}

}  // namespace SV_EVENT

std::ostream& operator<<(std::ostream& os, const SVCall& svCall)
{
  os << "SVCall: " << svCall.chrom << ":" << svCall.start << "-" << svCall.end << " " << svCall.eventLabel
     << " length: " << svCall.eventLength << " contig: " << svCall.contigName << ":" << svCall.contigStart
     << "-" << svCall.contigEnd;
  return os;
}

void readSVCalls(std::istream& is, std::vector<SVCall>& svCalls)
{
  using namespace svgt::blt_util;

  static const unsigned minColumnCount(8);

  svCalls.clear();
  istream_line_splitter dparse(is);
  while (dparse.parse_line()) {
    if (is_bed_header_or_blank(dparse)) continue;

    if (dparse.n_word() < minColumnCount) {
      std::ostringstream oss;
      oss << "Expected at least " << minColumnCount << " columns in SV call input line, found "
          << dparse.n_word() << ":\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
    }

    try {
      SVCall svCall;
      svCall.chrom       = dparse.word(0);
      svCall.start       = parse_int_str(dparse.word(1));
      svCall.end         = parse_int_str(dparse.word(2));
      svCall.eventLabel  = dparse.word(3);
      svCall.eventType   = SV_EVENT::parseLabel(svCall.eventLabel);
      svCall.eventLength = parse_int_str(dparse.word(4));
      svCall.contigName  = dparse.word(5);
      svCall.contigStart = parse_int_str(dparse.word(6));
      svCall.contigEnd   = parse_int_str(dparse.word(7));
      svCalls.push_back(svCall);
    } catch (const blt_exception& e) {
      std::ostringstream oss;
      oss << "Invalid SV call input line. " << e.what() << ":\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
    }
  }
}

void getBreakpointIntervals(
    const SVCall& svCall, const bam_header_info& bamHeader, std::vector<GenomeInterval>& breakpoints)
{
  breakpoints.clear();

  const int32_t tid(bamHeader.getChromIndex(svCall.contigName));
  if (tid < 0) {
    std::ostringstream oss;
    oss << "SV call contig '" << svCall.contigName << "' is not found in the alignment file header. "
        << svCall;
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }

  if (svCall.eventType == SV_EVENT::DELETION) {
    breakpoints.emplace_back(tid, svCall.contigStart, svCall.contigEnd);
  } else {
    breakpoints.emplace_back(tid, svCall.contigStart, svCall.contigStart + 1);
    breakpoints.emplace_back(tid, svCall.contigEnd - 1, svCall.contigEnd);
  }
}

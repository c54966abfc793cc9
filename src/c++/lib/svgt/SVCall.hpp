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

#pragma once

#include "blt_util/blt_types.hpp"
#include "htsapi/bam_header_info.hpp"
#include "svgt/GenomeInterval.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace SV_EVENT {
enum index_t { INSERTION, DELETION, OTHER };

/// \return INSERTION for "insertion", DELETION for "deletion" and OTHER for any other label
index_t parseLabel(const std::string& label);

const char* label(const index_t id);
}  // namespace SV_EVENT

/// \brief A structural variant call to be genotyped
///
/// The contig coordinates locate the event on the assembled contig sequences which the alignment files are
/// aligned to.
struct SVCall {
  std::string       chrom;
  pos_t             start = 0;
  pos_t             end   = 0;
  SV_EVENT::index_t eventType = SV_EVENT::OTHER;
  /// event type as given in the input, retained for the report
  std::string eventLabel;
  int         eventLength = 0;
  std::string contigName;
  pos_t       contigStart = 0;
  pos_t       contigEnd   = 0;
};

std::ostream& operator<<(std::ostream& os, const SVCall& svCall);

/// \brief Read all SV calls from a tab-delimited table
///
/// Columns are: chromosome, start, end, event type, event length, contig name, contig start, contig end.
/// Blank lines and "#", "track" or "browser" header lines are skipped. Any row with fewer than eight
/// columns or with a non-integer position is an error.
void readSVCalls(std::istream& is, std::vector<SVCall>& svCalls);

/// \brief Get the breakpoint intervals of an SV call
///
/// A deletion has the single interval [contigStart,contigEnd), any other event has the two 1-base
/// intervals [contigStart,contigStart+1) and [contigEnd-1,contigEnd).
///
/// \param[in] bamHeader Chromosome table used to find the index of the SV call's contig
void getBreakpointIntervals(
    const SVCall& svCall, const bam_header_info& bamHeader, std::vector<GenomeInterval>& breakpoints);

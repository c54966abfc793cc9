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

#include "htsapi/bam_record.hpp"
#include "htsapi/align_path_bam_util.hpp"

#include <iostream>

std::ostream& operator<<(std::ostream& os, const bam_record& br)
{
  if (br.empty()) {
    os << "NONE";
  } else {
    os << br.qname() << "/" << br.read_no() << " tid:pos:strand " << br.target_id() << ":" << (br.pos() - 1)
       << ":" << (br.is_fwd_strand() ? '+' : '-');

    ALIGNPATH::path_t apath;
    bam_cigar_to_apath(br.raw_cigar(), br.n_cigar(), apath);
    os << " cigar: " << apath;

    os << " templSize: " << br.template_size();

    if (br.is_unmapped()) {
      os << " isunmapped";
    }
    if (br.is_secondary()) {
      os << " issec";
    }
    if (br.is_supplementary()) {
      os << " issupp";
    }

    if (br.is_paired()) {
      os << " mate_tid:pos:strand " << br.mate_target_id() << ":" << (br.mate_pos() - 1) << ":"
         << (br.is_mate_fwd_strand() ? '+' : '-');
    }
  }
  return os;
}

bool bam_record::get_num_tag(const char* tag, int32_t& num) const
{
  // retrieve the BAM tag
  uint8_t* pTag = bam_aux_get(_bp, tag);
  if (!pTag) return false;

  // skip tags that are not encoded as integers
  if (!is_int_code(pTag[0])) return false;
  num = bam_aux2i(pTag);

  return true;
}

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

#include "htsapi/AlignedRead_bam_util.hpp"
#include "htsapi/align_path_bam_util.hpp"

void getAlignedRead(const bam_record& bamRead, AlignedRead& read)
{
  read.tid      = bamRead.target_id();
  read.beginPos = (bamRead.pos() - 1);
  bam_cigar_to_apath(bamRead.raw_cigar(), bamRead.n_cigar(), read.path);
  read.endPos = read.beginPos + static_cast<pos_t>(ALIGNPATH::apath_ref_length(read.path));
  ALIGNPATH::apath_aligned_blocks(read.beginPos, read.path, read.blocks);

  read.mapq = bamRead.map_qual();

  static const char nmTag[] = {'N', 'M'};
  int32_t           nm(0);
  read.isEditDistanceSet = bamRead.get_num_tag(nmTag, nm);
  read.editDistance      = (read.isEditDistanceSet ? static_cast<unsigned>(nm) : 0);

  read.readLength   = ALIGNPATH::apath_aligned_query_length(read.path);
  read.templateSize = bamRead.template_size();
  read.readNo       = bamRead.read_no();

  read.isUnmapped      = bamRead.is_unmapped();
  read.isMateUnmapped  = bamRead.is_mate_unmapped();
  read.isReverse       = (!bamRead.is_fwd_strand());
  read.isSecondary     = bamRead.is_secondary();
  read.isSupplementary = bamRead.is_supplementary();
}

AlignedRead getAlignedRead(const bam_record& bamRead)
{
  AlignedRead read;
  getAlignedRead(bamRead, read);
  return read;
}

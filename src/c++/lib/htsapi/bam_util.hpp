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
/// \brief bam record manipulation functions
/// \author Chris Saunders

#pragma once

extern "C" {
#include "htslib/hts.h"
#include "htslib/sam.h"
}

namespace BAM_FLAG {
enum index_t {
  PAIRED        = 0x001,
  PROPER_PAIR   = 0x002,
  UNMAPPED      = 0x004,
  MATE_UNMAPPED = 0x008,
  STRAND        = 0x010,
  MATE_STRAND   = 0x020,
  FIRST_READ    = 0x040,
  SECOND_READ   = 0x080,
  SECONDARY     = 0x100,
  FILTER        = 0x200,
  DUPLICATE     = 0x400,
  SUPPLEMENTARY = 0x800
};
}

/// insert new qname
///
void edit_bam_qname(const char* name, bam1_t& br);

/// Read length is taken from the read string. Assumes offset has
/// already been removed from qual
void edit_bam_read_and_quality(const char* read, const uint8_t* qual, bam1_t& br);

/// store an unsigned int to optional field "tag", optimize storage
/// based on size of x
void bam_aux_append_unsigned(bam1_t& br, const char* tag, uint32_t x);

/// change the size of a subsegment of the bam data, 'end' identifies
/// the byte offset of the end of the segment and 'delta' is the change
/// to the segment size
///
void change_bam_data_segment_len(const int end, const int delta, bam1_t& br);


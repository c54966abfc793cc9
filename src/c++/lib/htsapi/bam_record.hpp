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

#include "htsapi/bam_util.hpp"

#include <cassert>
#include <cstdlib>

#include <iosfwd>

struct bam_record {
  bam_record() : _bp(bam_init1()) {}

  ~bam_record() { freeBam(); }

  bam_record(const bam_record& br) : _bp(br.empty() ? bam_init1() : bam_dup1(br._bp)) {}

  bam_record& operator=(const bam_record& br)
  {
    if (this == &br) return (*this);

    if (empty()) {
      if (!br.empty()) {
        freeBam();
        _bp = bam_dup1(br._bp);
      }
      // else empty->empty : do nothing...
    } else {
      if (!br.empty()) {
        bam_copy1(_bp, br._bp);
      } else {
        freeBam();
        _bp = bam_init1();
      }
    }
    return (*this);
  }

  const char* qname() const { return bam_get_qname(_bp); }

  bool is_paired() const { return ((_bp->core.flag & BAM_FLAG::PAIRED) != 0); }
  bool is_unmapped() const { return ((_bp->core.flag & BAM_FLAG::UNMAPPED) != 0); }
  bool is_mate_unmapped() const { return ((_bp->core.flag & BAM_FLAG::MATE_UNMAPPED) != 0); }
  bool is_fwd_strand() const { return (!((_bp->core.flag & BAM_FLAG::STRAND) != 0)); }
  bool is_mate_fwd_strand() const { return (!((_bp->core.flag & BAM_FLAG::MATE_STRAND) != 0)); }
  bool is_first() const { return ((_bp->core.flag & BAM_FLAG::FIRST_READ) != 0); }
  bool is_second() const { return ((_bp->core.flag & BAM_FLAG::SECOND_READ) != 0); }
  bool is_secondary() const { return ((_bp->core.flag & BAM_FLAG::SECONDARY) != 0); }
  bool is_supplementary() const { return ((_bp->core.flag & BAM_FLAG::SUPPLEMENTARY) != 0); }

  void toggle_is_paired() { _bp->core.flag ^= BAM_FLAG::PAIRED; }
  void toggle_is_unmapped() { _bp->core.flag ^= BAM_FLAG::UNMAPPED; }
  void toggle_is_mate_unmapped() { _bp->core.flag ^= BAM_FLAG::MATE_UNMAPPED; }
  void toggle_is_fwd_strand() { _bp->core.flag ^= BAM_FLAG::STRAND; }
  void toggle_is_mate_fwd_strand() { _bp->core.flag ^= BAM_FLAG::MATE_STRAND; }
  void toggle_is_first() { _bp->core.flag ^= BAM_FLAG::FIRST_READ; }
  void toggle_is_second() { _bp->core.flag ^= BAM_FLAG::SECOND_READ; }
  void toggle_is_secondary() { _bp->core.flag ^= BAM_FLAG::SECONDARY; }
  void toggle_is_supplementary() { _bp->core.flag ^= BAM_FLAG::SUPPLEMENTARY; }

  int read_no() const { return ((is_second() && (!is_first())) ? 2 : 1); }

  int target_id() const { return _bp->core.tid; }

  int mate_target_id() const { return _bp->core.mtid; }

  /// one-indexed read start position
  int pos() const { return (_bp->core.pos + 1); }

  uint8_t map_qual() const { return _bp->core.qual; }

  int32_t template_size() const { return _bp->core.isize; }

  const uint32_t* raw_cigar() const { return bam_get_cigar(_bp); }
  unsigned        n_cigar() const { return _bp->core.n_cigar; }

  /// Get integer AUX field
  ///
  /// \param[in] tag AUX field tag. This is a char array of length two, null term is not required
  ///
  /// \return False if the field is not found or is not an integer
  bool get_num_tag(const char* tag, int32_t& num) const;

  void set_target_id(int32_t tid)
  {
    if (tid < -1) tid = -1;
    _bp->core.tid = tid;
  }

  void set_mate_target_id(int32_t tid)
  {
    if (tid < -1) tid = -1;
    _bp->core.mtid = tid;
  }

  bam1_t* get_data() { return _bp; }

  const bam1_t* get_data() const { return _bp; }

  bool empty() const
  {
    assert(nullptr != _bp);
    return (_bp->l_data == 0);
  }

private:
  friend struct bam_streamer;

  static bool is_int_code(char c)
  {
    switch (c) {
    case 'c':
    case 's':
    case 'i':
    case 'C':
    case 'S':
    case 'I':
      return true;
    default:
      return false;
    }
  }

  void freeBam()
  {
    if (nullptr != _bp) bam_destroy1(_bp);
  }

  bam1_t* _bp;
};

/// Generate summary bam_record output for developer debugging
std::ostream& operator<<(std::ostream& os, const bam_record& br);

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

#include "htsapi/bam_record.hpp"

#include "boost/utility.hpp"

#include <iosfwd>
#include <string>

/// Stream bam records from an indexed CRAM/BAM file, restricted to one genome region at a time
///
//
// Example use:
// bam_streamer stream("sample1.bam");
// stream.resetRegion(stream.target_name_to_id("chr1"), 1000000, 2000000);
// while (stream.next()) {
//     const bam_record& read(*(stream.get_record_ptr()));
//     if(read.is_unmapped()) unmappedCount++;
// }
//
struct bam_streamer : public boost::noncopyable {
  /// \param filename CRAM/BAM input file, an index must be available beside this file
  explicit bam_streamer(const char* filename);

  ~bam_streamer();

  /// \brief Set new region to iterate over
  ///
  /// \param referenceContigId htslib zero-indexed contig id
  /// \param beginPos start position (zero-indexed, closed)
  /// \param endPos end position (zero-indexed, open)
  void resetRegion(int referenceContigId, int beginPos, int endPos);

  /// \return False at the end of the current region
  bool next();

  const bam_record* get_record_ptr() const
  {
    if (_is_record_set)
      return &_brec;
    else
      return nullptr;
  }

  const char* name() const { return _stream_name.c_str(); }

  unsigned record_no() const { return _record_no; }

  void report_state(std::ostream& os) const;

  const char* target_id_to_name(const int32_t tid) const;

  /// \return Contig id or a negative value if seq_name is not in the header
  int32_t target_name_to_id(const char* seq_name) const;

  const bam_hdr_t& get_header() const { return *(_hdr); }

private:
  void _load_index();

  bool       _is_record_set;
  htsFile*   _hfp;
  bam_hdr_t* _hdr;
  hts_idx_t* _hidx;
  hts_itr_t* _hitr;
  bam_record _brec;

  // track for debug only:
  unsigned    _record_no;
  std::string _stream_name;
};

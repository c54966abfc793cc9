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

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

/// \brief Subset of information from a BAM file header
///
/// This stores for each chromosome, the label, size and corresponding BAM index id.
///
struct bam_header_info {
  bam_header_info() = default;

  explicit bam_header_info(const bam_hdr_t& header);

  bool empty() const { return (chrom_data.empty() && chrom_to_index.empty()); }

  /// \return Chromosome index, or a negative value if label is not in the header
  int32_t getChromIndex(const std::string& label) const
  {
    const auto iter(chrom_to_index.find(label));
    if (iter == chrom_to_index.end()) return -1;
    return iter->second;
  }

  struct chrom_info {
    explicit chrom_info(const char* init_label = nullptr, const unsigned init_length = 0)
      : label((nullptr == init_label) ? "" : init_label), length(init_length)
    {
    }

    bool operator==(const chrom_info& rhs) const { return ((label == rhs.label) && (length == rhs.length)); }

    std::string label;
    unsigned    length;
  };

  std::vector<chrom_info>        chrom_data;
  std::map<std::string, int32_t> chrom_to_index;
};

/// \brief Print header info to stream in a simple tabular format
std::ostream& operator<<(std::ostream& os, const bam_header_info& bhi);

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

#include "blt_util/AlignedRead.hpp"

#include <cassert>

#include <iosfwd>
#include <vector>

/// \brief One or two aligned reads sharing a read name
///
/// Reads are ordered by ascending reference start position, so that read index 0 is the leftmost read and
/// not necessarily the first read of the template. Reads at the same position are ordered mapped before
/// unmapped, and then by read number.
struct ReadPair {
  ReadPair() = default;

  explicit ReadPair(const AlignedRead& read1) { addRead(read1); }

  ReadPair(const AlignedRead& read1, const AlignedRead& read2)
  {
    addRead(read1);
    addRead(read2);
  }

  /// \brief Add a read in its sorted position, a pair can hold at most two reads
  void addRead(const AlignedRead& read);

  unsigned size() const { return _reads.size(); }

  bool isComplete() const { return (size() == 2); }

  const AlignedRead& operator[](const unsigned index) const
  {
    assert(index < size());
    return _reads[index];
  }

  const AlignedRead& front() const { return _reads.front(); }
  const AlignedRead& back() const { return _reads.back(); }

  /// \brief Ordering of reads within a pair
  static bool isReadOrderedBefore(const AlignedRead& lhs, const AlignedRead& rhs)
  {
    if (lhs.beginPos != rhs.beginPos) return (lhs.beginPos < rhs.beginPos);
    if (lhs.isUnmapped != rhs.isUnmapped) return rhs.isUnmapped;
    return (lhs.readNo < rhs.readNo);
  }

private:
  std::vector<AlignedRead> _reads;
};

std::ostream& operator<<(std::ostream& os, const ReadPair& pair);

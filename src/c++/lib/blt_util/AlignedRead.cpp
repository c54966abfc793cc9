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

#include "blt_util/AlignedRead.hpp"

#include <iostream>

std::ostream& operator<<(std::ostream& os, const AlignedRead& read)
{
  os << "AlignedRead: readNo: " << read.readNo << " tid:range:strand " << read.tid << ":" << read.refRange()
     << ":" << (read.isReverse ? '-' : '+') << " cigar: " << read.path << " mapq: " << read.mapq;
  if (read.isEditDistanceSet) os << " NM: " << read.editDistance;
  os << " templSize: " << read.templateSize;
  if (read.isUnmapped) os << " unmapped";
  if (read.isMateUnmapped) os << " mate_unmapped";
  return os;
}

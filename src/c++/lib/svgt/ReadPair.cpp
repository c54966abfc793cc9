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

#include "svgt/ReadPair.hpp"
#include "blt_util/blt_exception.hpp"

#include <algorithm>
#include <iostream>

void ReadPair::addRead(const AlignedRead& read)
{
  if (isComplete()) {
    throw blt_exception("Can't add more than two reads to a read pair");
  }
  const auto insertIter(std::upper_bound(_reads.begin(), _reads.end(), read, isReadOrderedBefore));
  _reads.insert(insertIter, read);
}

std::ostream& operator<<(std::ostream& os, const ReadPair& pair)
{
  os << "ReadPair: size: " << pair.size() << "\n";
  for (unsigned readIndex(0); readIndex < pair.size(); ++readIndex) {
    os << "\t" << pair[readIndex] << "\n";
  }
  return os;
}

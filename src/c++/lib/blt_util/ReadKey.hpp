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

#include <iosfwd>
#include <string>

/// information required to uniquely identify a read:
///
struct ReadKey {
  explicit ReadKey(const bam_record& br) : _qname(br.qname()), _readNo(br.read_no()) {}

  ReadKey(const char* initQname, const int initReadNo) : _qname(initQname), _readNo(initReadNo) {}

  int readNo() const { return _readNo; }

  const std::string& qname() const { return _qname; }

  bool operator<(const ReadKey& rhs) const
  {
    if (readNo() < rhs.readNo()) return true;
    if (readNo() == rhs.readNo()) {
      return (qname() < rhs.qname());
    }
    return false;
  }

  bool operator==(const ReadKey& rhs) const
  {
    return ((readNo() == rhs.readNo()) && (qname() == rhs.qname()));
  }

private:
  std::string _qname;
  int         _readNo;
};

std::ostream& operator<<(std::ostream& os, const ReadKey& rk);

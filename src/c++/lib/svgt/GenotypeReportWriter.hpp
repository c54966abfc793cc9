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

#include "common/OutStream.hpp"
#include "svgt/GenotypeModel.hpp"
#include "svgt/ReadPairClassifier.hpp"
#include "svgt/SVCall.hpp"

#include "boost/utility.hpp"

#include <string>

/// \brief Write the tab-delimited genotype report, with one row for each SV call and sample
///
/// The header line is written on construction.
struct GenotypeReportWriter : private boost::noncopyable {
  /// \param filename Report file name, an empty name, "-" or "/dev/stdout" selects stdout
  explicit GenotypeReportWriter(const std::string& filename);

  void writeCall(
      const SVCall& svCall, const ReadPairClassification& classification, const GenotypeCall& genotypeCall);

  /// \brief Close the report, any write failure is reported as an exception
  void close() { _outStream.close(); }

private:
  OutStream _outStream;
};

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

#include "svgt/GenotypeReportWriter.hpp"

#include <iomanip>
#include <iostream>

GenotypeReportWriter::GenotypeReportWriter(const std::string& filename) : _outStream(filename)
{
  static const char sep('\t');

  std::ostream& os(_outStream.getStream());
  os << "chr" << sep << "start" << sep << "end" << sep << "sv_call" << sep << "concordant" << sep
     << "discordant" << sep << "genotype" << sep << "genotype_likelihood" << '\n';
  os << std::fixed;
}

void GenotypeReportWriter::writeCall(
    const SVCall& svCall, const ReadPairClassification& classification, const GenotypeCall& genotypeCall)
{
  static const char sep('\t');

  std::ostream& os(_outStream.getStream());
  os << svCall.contigName << sep << svCall.contigStart << sep << svCall.contigEnd << sep << svCall.eventLabel
     << sep;
  os << std::setprecision(2);
  os << static_cast<double>(classification.concordant) << sep;
  os << static_cast<double>(classification.discordant) << sep;
  os << GENOTYPE::label(genotypeCall.genotype) << sep;
  os << std::setprecision(1);
  os << static_cast<double>(genotypeCall.likelihood.value) << '\n';
}

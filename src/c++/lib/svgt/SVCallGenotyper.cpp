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

#include "svgt/SVCallGenotyper.hpp"
#include "svgt/GenomeIntervalUtil.hpp"
#include "svgt/GenotypeModel.hpp"

#include <iostream>

void genotypeSVCalls(
    const std::vector<SVCall>&                  svCalls,
    const std::vector<std::unique_ptr<Sample>>& samples,
    const bam_header_info&                      bamHeader,
    const ReadPairClassifier&                   classifier,
    const GenotypeCallOptions&                  genotypeOpt,
    PairEvidenceWriter&                         evidenceWriter,
    GenotypeReportWriter&                       reportWriter,
    std::ostream&                               dlog)
{
  std::vector<GenomeInterval> breakpoints;
  for (const SVCall& svCall : svCalls) {
    getBreakpointIntervals(svCall, bamHeader, breakpoints);

    for (const std::unique_ptr<Sample>& samplePtr : samples) {
      Sample&                           sample(*samplePtr);
      const std::vector<GenomeInterval> fetchRegions(padAndMergeIntervals(
          breakpoints, sample.getInsertSizeStats().getBreakpointPadding(), bamHeader));

      const ReadPairClassification classification(classifier.classify(
          sample, bamHeader, fetchRegions, breakpoints, svCall.eventType, &evidenceWriter));
      const GenotypeCall genotypeCall(
          callGenotype(classification.concordant, classification.discordant, genotypeOpt));

      dlog << "Concordant depth: " << classification.concordant << '\n';
      dlog << "Discordant depth: " << classification.discordant << '\n';
      dlog << svCall << " " << genotypeCall << '\n';

      reportWriter.writeCall(svCall, classification, genotypeCall);
    }
  }
}

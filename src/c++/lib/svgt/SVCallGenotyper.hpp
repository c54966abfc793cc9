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

#include "htsapi/bam_header_info.hpp"
#include "options/GenotypeCallOptions.hpp"
#include "svgt/GenotypeReportWriter.hpp"
#include "svgt/PairEvidenceWriter.hpp"
#include "svgt/ReadPairClassifier.hpp"
#include "svgt/SVCall.hpp"
#include "svgt/Sample.hpp"

#include <iosfwd>
#include <memory>
#include <vector>

/// \brief Genotype every SV call in every sample
///
/// SV calls are processed in input order, and for each call the samples are processed in the given
/// order, so that one report row is written per (SV call, sample) in that order. The read fetch regions
/// of each sample are padded by that sample's own median insert size.
///
/// \param[in] bamHeader Chromosome table used to locate the SV calls, this is the header of the first
/// sample
/// \param[in] dlog Debug log receiving the counts and genotype of each (SV call, sample)
void genotypeSVCalls(
    const std::vector<SVCall>&                  svCalls,
    const std::vector<std::unique_ptr<Sample>>& samples,
    const bam_header_info&                      bamHeader,
    const ReadPairClassifier&                   classifier,
    const GenotypeCallOptions&                  genotypeOpt,
    PairEvidenceWriter&                         evidenceWriter,
    GenotypeReportWriter&                       reportWriter,
    std::ostream&                               dlog);

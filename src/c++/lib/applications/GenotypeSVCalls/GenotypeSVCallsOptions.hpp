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

#include "common/Program.hpp"
#include "options/AlignmentFileOptions.hpp"
#include "options/GenotypeCallOptions.hpp"
#include "options/ReadPairClassifierOptions.hpp"

#include <string>

struct GenotypeSVCallsOptions {
  AlignmentFileOptions      alignFileOpt;
  ReadPairClassifierOptions classifierOpt;
  GenotypeCallOptions       genotypeOpt;

  std::string svCallsFilename;
  std::string controlRegionsFilename;
  std::string outputFilename;
  std::string concordantBamFilename = "concordant_reads.bam";
  std::string discordantBamFilename = "discordant_reads.bam";
  std::string debugLogFilename      = "genotyper.log";
};

/// \brief Parse the command line into \p opt, or print usage and exit if the command line is invalid
///
/// Positional arguments are taken as "sv-calls control-regions align-file... output". Each positional
/// argument fills the next of these which was not already given as a named option.
void parseGenotypeSVCallsOptions(
    const svgt::Program& prog, int argc, char* argv[], GenotypeSVCallsOptions& opt);

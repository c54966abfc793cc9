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

#include "GenotypeSVCalls.hpp"
#include "GenotypeSVCallsOptions.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"
#include "common/OutStream.hpp"
#include "htsapi/bam_header_info.hpp"
#include "svgt/ControlRegion.hpp"
#include "svgt/GenotypeReportWriter.hpp"
#include "svgt/PairEvidenceWriter.hpp"
#include "svgt/ReadPairClassifier.hpp"
#include "svgt/SVCall.hpp"
#include "svgt/SVCallGenotyper.hpp"
#include "svgt/Sample.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

static void openInputFile(const std::string& filename, std::ifstream& ifs)
{
  ifs.open(filename.c_str());
  if (!ifs) {
    std::ostringstream oss;
    oss << "Can't open input file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }
}

static void runGenotypeSVCalls(const GenotypeSVCallsOptions& opt)
{
  std::vector<SVCall> svCalls;
  {
    std::ifstream ifs;
    openInputFile(opt.svCallsFilename, ifs);
    readSVCalls(ifs, svCalls);
  }
  log_os << "INFO: Read " << svCalls.size() << " SV calls from '" << opt.svCallsFilename << "'\n";

  std::vector<ControlRegion> copyTwoRegions;
  {
    std::vector<ControlRegion> controlRegions;
    std::ifstream              ifs;
    openInputFile(opt.controlRegionsFilename, ifs);
    readControlRegions(ifs, controlRegions);
    getCopyNumberTwoRegions(controlRegions, copyTwoRegions);
  }
  log_os << "INFO: Read " << copyTwoRegions.size() << " copy number 2 control regions from '"
         << opt.controlRegionsFilename << "'\n";

  std::vector<std::unique_ptr<Sample>> samples;
  for (const std::string& alignmentFilename : opt.alignFileOpt.alignmentFilenames) {
    samples.emplace_back(new Sample(alignmentFilename, copyTwoRegions, opt.classifierOpt));
  }

  // breakpoint chromosome indices and lengths refer to the header of the first alignment file
  const bam_hdr_t&      primaryHeader(samples.front()->getHeader());
  const bam_header_info bamHeader(primaryHeader);

  OutStream                debugLog(opt.debugLogFilename);
  std::ostream&            dlog(debugLog.getStream());
  const ReadPairClassifier classifier(opt.classifierOpt, &dlog);
  PairEvidenceWriter       evidenceWriter(
      opt.concordantBamFilename, opt.discordantBamFilename, primaryHeader);
  GenotypeReportWriter reportWriter(opt.outputFilename);

  genotypeSVCalls(
      svCalls, samples, bamHeader, classifier, opt.genotypeOpt, evidenceWriter, reportWriter, dlog);

  reportWriter.close();
  evidenceWriter.close();
  debugLog.close();

  log_os << "INFO: Genotyped " << svCalls.size() << " SV calls in " << samples.size() << " alignment files\n";
}

void GenotypeSVCalls::runInternal(int argc, char* argv[]) const
{
  GenotypeSVCallsOptions opt;

  parseGenotypeSVCallsOptions(*this, argc, argv, opt);
  runGenotypeSVCalls(opt);
}

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

#include "boost/test/unit_test.hpp"

#include "svgt/SVCallGenotyper.hpp"
#include "test/testAlignmentDataUtil.hpp"
#include "test/testUtil.hpp"

#include "boost/filesystem.hpp"

#include <fstream>
#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(test_SVCallGenotyper)

static std::vector<std::string> readLines(const std::string& filename)
{
  std::ifstream            ifs(filename);
  std::vector<std::string> lines;
  std::string              line;
  while (std::getline(ifs, line)) lines.push_back(line);
  return lines;
}

static SVCall getTestDeletion(const pos_t start, const pos_t end)
{
  SVCall svCall;
  svCall.chrom       = "chrFoo";
  svCall.start       = start;
  svCall.end         = end;
  svCall.eventType   = SV_EVENT::DELETION;
  svCall.eventLabel  = "deletion";
  svCall.eventLength = end - start;
  svCall.contigName  = "chrFoo";
  svCall.contigStart = start;
  svCall.contigEnd   = end;
  return svCall;
}

/// \brief Two indexed alignment files listing the test chromosomes in opposite order
struct TwoSampleTestBamFiles {
  TwoSampleTestBamFiles() : bamFilename1(getNewTempFile() + ".bam"), bamFilename2(getNewTempFile() + ".bam")
  {
    // first sample, reads on chrFoo at index 0
    {
      std::vector<bam_record> reads(3);
      buildTestBamRecord(reads[0], 0, 900, 0, 1101, 100, 60, "", 301, 0, "s1Concordant");
      buildTestBamRecord(reads[1], 0, 1101, 0, 900, 100, 60, "", 301, 0, "s1Concordant");
      makeSecondReadOfPair(reads[1]);

      // anchored left of the second deletion, with an unmapped mate
      buildTestBamRecord(reads[2], 0, 2800, 0, 2800, 100, 60, "", 0, 0, "s1Anchored");
      reads[2].toggle_is_mate_unmapped();

      buildTestBamFile(buildTestBamHeader(), reads, bamFilename1);
    }

    // second sample, reads on chrFoo at index 1
    {
      std::vector<bam_record> reads(3);

      // anchored left of the first deletion, but outside of this sample's fetch region
      buildTestBamRecord(reads[0], 1, 650, 1, 650, 100, 60, "", 0, 0, "s2Outside");
      reads[0].toggle_is_mate_unmapped();

      buildTestBamRecord(reads[1], 1, 900, 1, 1101, 100, 60, "", 201, 0, "s2Concordant");
      buildTestBamRecord(reads[2], 1, 1101, 1, 900, 100, 60, "", 201, 0, "s2Concordant");
      makeSecondReadOfPair(reads[2]);

      const bam_header_info bamHeader2(buildTestBamHeader(
          {bam_header_info::chrom_info("chrBar", 5000), bam_header_info::chrom_info("chrFoo", 5000)}));
      buildTestBamFile(bamHeader2, reads, bamFilename2);
    }
  }

  ~TwoSampleTestBamFiles()
  {
    for (const std::string& bamFilename : {bamFilename1, bamFilename2}) {
      boost::filesystem::remove(bamFilename);
      boost::filesystem::remove(bamFilename + ".bai");
    }
  }

  std::string bamFilename1;
  std::string bamFilename2;
};

BOOST_AUTO_TEST_CASE(test_genotypeSVCalls)
{
  const TwoSampleTestBamFiles testFiles;

  std::vector<std::unique_ptr<Sample>> samples;
  samples.emplace_back(
      new Sample(testFiles.bamFilename1, computeInsertSizeStats({300, 300, 320, 280}, 1.5)));
  samples.emplace_back(
      new Sample(testFiles.bamFilename2, computeInsertSizeStats({200, 200, 220, 180}, 1.5)));
  BOOST_REQUIRE_EQUAL(samples[0]->getInsertSizeStats().getBreakpointPadding(), 300);
  BOOST_REQUIRE_EQUAL(samples[1]->getInsertSizeStats().getBreakpointPadding(), 200);

  const bam_header_info     bamHeader(samples.front()->getHeader());
  const std::vector<SVCall> svCalls = {getTestDeletion(1000, 1100), getTestDeletion(3000, 3100)};

  std::ostringstream        debugLog;
  ReadPairClassifierOptions classifierOpt;
  const ReadPairClassifier  classifier(classifierOpt, &debugLog);
  GenotypeCallOptions       genotypeOpt;

  const std::string reportFilename(getNewTempFile());
  const std::string concordantFilename(getNewTempFile() + ".bam");
  const std::string discordantFilename(getNewTempFile() + ".bam");
  {
    PairEvidenceWriter   evidenceWriter(concordantFilename, discordantFilename, samples.front()->getHeader());
    GenotypeReportWriter reportWriter(reportFilename);
    genotypeSVCalls(
        svCalls, samples, bamHeader, classifier, genotypeOpt, evidenceWriter, reportWriter, debugLog);
    reportWriter.close();
    evidenceWriter.close();
  }

  // one row per SV call and sample, calls in input order, samples in the given order
  const std::vector<std::string> lines(readLines(reportFilename));
  BOOST_REQUIRE_EQUAL(lines.size(), 5u);
  BOOST_REQUIRE_EQUAL(lines[0].find("chr\tstart\tend\tsv_call"), 0u);

  // s2Outside is only reached if the second sample were padded by the first sample's median
  BOOST_REQUIRE_EQUAL(lines[1].find("chrFoo\t1000\t1100\tdeletion\t1.00\t0.00\t./.\t"), 0u);
  BOOST_REQUIRE_EQUAL(lines[2].find("chrFoo\t1000\t1100\tdeletion\t1.00\t0.00\t./.\t"), 0u);
  BOOST_REQUIRE_EQUAL(lines[3].find("chrFoo\t3000\t3100\tdeletion\t0.00\t1.00\t./.\t"), 0u);
  BOOST_REQUIRE_EQUAL(lines[4].find("chrFoo\t3000\t3100\tdeletion\t0.00\t0.00\t./.\t"), 0u);

  BOOST_REQUIRE(debugLog.str().find("(s2Outside)") == std::string::npos);

  // evidence reads of both samples are written on the first sample's chromosome indices
  bam_header_info         concordantHeader;
  std::vector<bam_record> concordantReads;
  readTestBamFile(concordantFilename, concordantHeader, concordantReads);
  BOOST_REQUIRE_EQUAL(concordantHeader.chrom_data[0].label, "chrFoo");
  BOOST_REQUIRE_EQUAL(concordantReads.size(), 4u);
  const char* expectedConcordantNames[] = {"s1Concordant", "s1Concordant", "s2Concordant", "s2Concordant"};
  for (unsigned readIndex(0); readIndex < concordantReads.size(); ++readIndex) {
    const bam_record& read(concordantReads[readIndex]);
    BOOST_REQUIRE_EQUAL(std::string(read.qname()), expectedConcordantNames[readIndex]);
    BOOST_REQUIRE_EQUAL(read.target_id(), 0);
    BOOST_REQUIRE_EQUAL(read.mate_target_id(), 0);
  }

  bam_header_info         discordantHeader;
  std::vector<bam_record> discordantReads;
  readTestBamFile(discordantFilename, discordantHeader, discordantReads);
  BOOST_REQUIRE_EQUAL(discordantReads.size(), 1u);
  BOOST_REQUIRE_EQUAL(std::string(discordantReads[0].qname()), "s1Anchored");
  BOOST_REQUIRE_EQUAL(discordantReads[0].target_id(), 0);

  for (const std::string& filename : {reportFilename, concordantFilename, discordantFilename}) {
    boost::filesystem::remove(filename);
  }
}

BOOST_AUTO_TEST_SUITE_END()

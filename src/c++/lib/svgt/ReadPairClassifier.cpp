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

#include "svgt/ReadPairClassifier.hpp"
#include "blt_util/ReadKey.hpp"
#include "common/Exceptions.hpp"
#include "htsapi/AlignedRead_bam_util.hpp"
#include "svgt/AlignmentPredicates.hpp"
#include "svgt/PairEvidenceWriter.hpp"
#include "svgt/Sample.hpp"

#include <cassert>
#include <cstdlib>

#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace PAIR_CLASS {

const char* label(const index_t id)
{
  switch (id) {
  case CONCORDANT:
    return "Concordant";
  case DISCORDANT:
    return "Discordant";
  default:
    return "Unclassified";
  }
}

}  // namespace PAIR_CLASS

ReadPairRuleContext::ReadPairRuleContext(
    const ReadPair&                    initPair,
    const std::vector<GenomeInterval>& initBreakpoints,
    const InsertSizeStats&             initStats,
    const double                       initMaxErrorRate)
  : pair(initPair), breakpoints(initBreakpoints), stats(initStats), maxErrorRate(initMaxErrorRate)
{
  assert(pair.size() > 0);
  assert(!breakpoints.empty());
  svSpan = GenomeInterval(
      breakpoints.front().tid, breakpoints.front().range.begin_pos(), breakpoints.back().range.end_pos());
}

bool ReadPairRuleContext::isPerfect(const AlignedRead& read) const
{
  return hasPerfectMapping(read, maxErrorRate);
}

bool ReadPairRuleContext::isPerfectInwardPair() const
{
  return (
      pair.isComplete() && isPerfect(pair[0]) && isPerfect(pair[1]) && (!pair[0].isReverse) &&
      pair[1].isReverse);
}

/// \return True if the read soft-clips at any breakpoint
static bool isSoftClippedAtAnyBreakpoint(const ReadPairRuleContext& context, const AlignedRead& read)
{
  for (const GenomeInterval& breakpoint : context.breakpoints) {
    if (softClipsAtBreakpoint(read, breakpoint, context.maxErrorRate)) return true;
  }
  return false;
}

/// \return True if a read maps to another chromosome than its mate, or is unmapped
static bool isMateLost(const AlignedRead& mate, const AlignedRead& anchor)
{
  return (mate.isUnmapped || (mate.tid != anchor.tid));
}

//
// insertion rules:
//

static bool insertionReadSpansWithGaps(const ReadPairRuleContext& context)
{
  const ReadPair& pair(context.pair);
  for (unsigned readIndex(0); readIndex < pair.size(); ++readIndex) {
    const AlignedRead& read(pair[readIndex]);
    if (spansRegion(read, context.svSpan) && hasGapsInRegion(read, context.svSpan)) return true;
  }
  return false;
}

static bool insertionSoftClipsAtBreakpoint(const ReadPairRuleContext& context)
{
  const ReadPair& pair(context.pair);
  if (isSoftClippedAtAnyBreakpoint(context, pair[0])) return true;
  return (pair.isComplete() && isSoftClippedAtAnyBreakpoint(context, pair[1]));
}

static bool insertionForwardReadSpansLeftBreakpoint(const ReadPairRuleContext& context)
{
  const AlignedRead& read(context.pair[0]);
  return ((!read.isReverse) && context.isPerfect(read) && spansRegion(read, context.breakpoints.front()));
}

static bool insertionReverseMateSpansRightBreakpoint(const ReadPairRuleContext& context)
{
  if (!context.pair.isComplete()) return false;
  const AlignedRead& read(context.pair[1]);
  return (read.isReverse && context.isPerfect(read) && spansRegion(read, context.breakpoints.back()));
}

static bool insertionPairAnchoredAcrossBreakpoint(const ReadPairRuleContext& context)
{
  if (!context.isPerfectInwardPair()) return false;

  const ReadPair&                    pair(context.pair);
  const std::vector<GenomeInterval>& breakpoints(context.breakpoints);
  const bool                         isRead1Outside(mapsOutsideRegions(pair[0], breakpoints));
  const bool                         isRead2Outside(mapsOutsideRegions(pair[1], breakpoints));
  return (
      (isRead1Outside != isRead2Outside) || (isRead1Outside && spansRegion(pair[1], breakpoints.front())) ||
      (spansRegion(pair[0], breakpoints.back()) && isRead2Outside));
}

static bool insertionPairTooFarApart(const ReadPairRuleContext& context)
{
  if (!context.isPerfectInwardPair()) return false;
  return context.stats.isAboveUpperThreshold(std::abs(context.pair[0].templateSize));
}

//
// deletion rules:
//

static bool deletionPairSpansBreakpoints(const ReadPairRuleContext& context)
{
  return (context.isPerfectInwardPair() && pairSpansRegions(context.pair, context.breakpoints));
}

static bool deletionProperPairSpansBreakpoints(const ReadPairRuleContext& context)
{
  return (deletionPairSpansBreakpoints(context) && isProperPair(context.pair[0], context.stats));
}

static bool deletionPairTooCloseTogether(const ReadPairRuleContext& context)
{
  return (
      deletionPairSpansBreakpoints(context) &&
      context.stats.isBelowLowerThreshold(std::abs(context.pair[0].templateSize)));
}

static bool deletionAnchoredLeft(const ReadPairRuleContext& context)
{
  const ReadPair&    pair(context.pair);
  const AlignedRead& read(pair[0]);
  if (!(context.isPerfect(read) && (!read.isReverse) &&
        (read.endPos < context.breakpoints.front().range.begin_pos()))) {
    return false;
  }
  return ((!pair.isComplete()) || isMateLost(pair[1], read));
}

static bool deletionSingleReadAnchoredRight(const ReadPairRuleContext& context)
{
  const ReadPair& pair(context.pair);
  if (pair.isComplete()) return false;
  const AlignedRead& read(pair[0]);
  return (
      context.isPerfect(read) && read.isReverse &&
      (read.beginPos > context.breakpoints.back().range.end_pos()));
}

static bool deletionMateAnchoredRight(const ReadPairRuleContext& context)
{
  const ReadPair& pair(context.pair);
  if (!pair.isComplete()) return false;
  const AlignedRead& read(pair[1]);
  return (
      context.isPerfect(read) && read.isReverse &&
      (read.beginPos > context.breakpoints.back().range.end_pos()) && isMateLost(pair[0], read));
}

static bool deletionSoftClipsAtBreakpoint(const ReadPairRuleContext& context)
{
  const ReadPair&       pair(context.pair);
  const GenomeInterval& breakpoint(context.breakpoints.front());
  if (softClipsAtBreakpoint(pair[0], breakpoint, context.maxErrorRate)) return true;
  return (pair.isComplete() && softClipsAtBreakpoint(pair[1], breakpoint, context.maxErrorRate));
}

//
// control rule:
//

static bool controlProperPair(const ReadPairRuleContext& context)
{
  return (context.isPerfectInwardPair() && isProperPair(context.pair[0], context.stats));
}

const std::vector<ReadPairRule>& getReadPairRules(const SV_EVENT::index_t svType)
{
  using namespace PAIR_CLASS;

  static const std::vector<ReadPairRule> insertionRules = {
      {"read spans SV with gaps", insertionReadSpansWithGaps, DISCORDANT},
      {"soft clips at breakpoint", insertionSoftClipsAtBreakpoint, DISCORDANT},
      {"forward read spans left breakpoint", insertionForwardReadSpansLeftBreakpoint, CONCORDANT},
      {"reverse mate spans right breakpoint", insertionReverseMateSpansRightBreakpoint, CONCORDANT},
      {"pair anchored across breakpoint", insertionPairAnchoredAcrossBreakpoint, CONCORDANT},
      {"too far apart", insertionPairTooFarApart, DISCORDANT}};

  static const std::vector<ReadPairRule> deletionRules = {
      {"proper pair spans breakpoints", deletionProperPairSpansBreakpoints, CONCORDANT},
      {"too close together", deletionPairTooCloseTogether, DISCORDANT},
      {"one end anchored to left", deletionAnchoredLeft, DISCORDANT},
      {"one end anchored to right", deletionSingleReadAnchoredRight, DISCORDANT},
      {"one end anchored to right", deletionMateAnchoredRight, DISCORDANT},
      {"soft clips at breakpoint", deletionSoftClipsAtBreakpoint, DISCORDANT}};

  static const std::vector<ReadPairRule> controlRules = {
      {"proper pair", controlProperPair, CONCORDANT}};

  switch (svType) {
  case SV_EVENT::INSERTION:
    return insertionRules;
  case SV_EVENT::DELETION:
    return deletionRules;
  default:
    return controlRules;
  }
}

PAIR_CLASS::index_t classifyReadPair(
    const std::vector<ReadPairRule>& rules,
    const ReadPairRuleContext&       context,
    const ReadPairRule*&             matchedRule)
{
  matchedRule = nullptr;
  for (const ReadPairRule& rule : rules) {
    if (rule.predicate(context)) {
      matchedRule = &rule;
      return rule.outcome;
    }
  }
  return PAIR_CLASS::UNCLASSIFIED;
}

void ReadPairClassifier::collectReadPairs(
    Sample&                            sample,
    const bam_header_info&             bamHeader,
    const std::vector<GenomeInterval>& fetchRegions,
    std::vector<ReadPairRecords>&      readPairs) const
{
  readPairs.clear();

  bam_streamer& bamStream(sample.getStream());

  std::set<ReadKey>                                   readKeys;
  std::map<std::string, std::vector<bam_record>>      recordsByName;
  for (const GenomeInterval& region : fetchRegions) {
    assert((region.tid >= 0) && (region.tid < static_cast<int32_t>(bamHeader.chrom_data.size())));
    const std::string& chromName(bamHeader.chrom_data[region.tid].label);
    const int32_t      sampleTid(bamStream.target_name_to_id(chromName.c_str()));
    if (sampleTid < 0) {
      std::ostringstream oss;
      oss << "Chromosome '" << chromName << "' is not found in alignment file '" << sample.name() << "'";
      BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
    }

    bamStream.resetRegion(sampleTid, region.range.begin_pos(), region.range.end_pos());
    while (bamStream.next()) {
      const bam_record& bamRead(*(bamStream.get_record_ptr()));
      if (bamRead.is_secondary() || bamRead.is_supplementary()) continue;
      if (!readKeys.insert(ReadKey(bamRead)).second) continue;
      recordsByName[bamRead.qname()].push_back(bamRead);
    }
  }

  for (const auto& nameRecords : recordsByName) {
    readPairs.emplace_back();
    ReadPairRecords& readPair(readPairs.back());
    readPair.records = nameRecords.second;
    for (const bam_record& bamRead : readPair.records) {
      readPair.pair.addRead(getAlignedRead(bamRead));
    }
  }
}

ReadPairClassification ReadPairClassifier::classify(
    Sample&                            sample,
    const bam_header_info&             bamHeader,
    const std::vector<GenomeInterval>& fetchRegions,
    const std::vector<GenomeInterval>& breakpoints,
    const SV_EVENT::index_t            svType,
    PairEvidenceWriter*                evidenceWriterPtr) const
{
  std::vector<ReadPairRecords> readPairs;
  collectReadPairs(sample, bamHeader, fetchRegions, readPairs);

  if (nullptr != _debugLogPtr) {
    std::ostream& dlog(*_debugLogPtr);
    dlog << "Found " << readPairs.size() << " potential read pairs for " << SV_EVENT::label(svType) << " at";
    for (const GenomeInterval& region : fetchRegions) {
      dlog << " ";
      summarizeGenomeInterval(bamHeader, region, dlog);
    }
    dlog << " in '" << sample.name() << "'\n";
  }

  const std::vector<ReadPairRule>& rules(getReadPairRules(svType));

  ReadPairClassification classification;
  for (const ReadPairRecords& readPair : readPairs) {
    const ReadPairRuleContext context(
        readPair.pair, breakpoints, sample.getInsertSizeStats(), _opt.maxErrorRate);
    const ReadPairRule*       matchedRule(nullptr);
    const PAIR_CLASS::index_t pairClass(classifyReadPair(rules, context, matchedRule));

    if (pairClass == PAIR_CLASS::UNCLASSIFIED) continue;

    if (nullptr != _debugLogPtr) {
      assert(nullptr != matchedRule);
      *_debugLogPtr << PAIR_CLASS::label(pairClass) << ": " << matchedRule->label << " ("
                    << readPair.records.front().qname() << ")\n";
    }

    if (pairClass == PAIR_CLASS::CONCORDANT) {
      classification.concordant++;
      if (nullptr != evidenceWriterPtr) {
        evidenceWriterPtr->writeConcordantReads(readPair.records, sample.getHeader());
      }
    } else {
      classification.discordant++;
      if (nullptr != evidenceWriterPtr) {
        evidenceWriterPtr->writeDiscordantReads(readPair.records, sample.getHeader());
      }
    }
  }
  return classification;
}

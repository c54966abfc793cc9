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
/// Classification of the read pairs around an SV's breakpoints as concordant (supporting the reference) or
/// discordant (supporting the SV)
///

#pragma once

#include "htsapi/bam_header_info.hpp"
#include "htsapi/bam_record.hpp"
#include "options/ReadPairClassifierOptions.hpp"
#include "svgt/GenomeInterval.hpp"
#include "svgt/InsertSizeStats.hpp"
#include "svgt/ReadPair.hpp"
#include "svgt/SVCall.hpp"

#include <iosfwd>
#include <string>
#include <vector>

struct PairEvidenceWriter;
struct Sample;

namespace PAIR_CLASS {
enum index_t { CONCORDANT, DISCORDANT, UNCLASSIFIED };

const char* label(const index_t id);
}  // namespace PAIR_CLASS

/// \brief All information a classification rule can use to evaluate one read pair
struct ReadPairRuleContext {
  ReadPairRuleContext(
      const ReadPair&                    initPair,
      const std::vector<GenomeInterval>& initBreakpoints,
      const InsertSizeStats&             initStats,
      const double                       initMaxErrorRate);

  /// \return True if the read is perfectly mapped
  bool isPerfect(const AlignedRead& read) const;

  /// \return True if the pair has two perfectly mapped reads, with the first on the forward strand and the
  /// second on the reverse strand
  bool isPerfectInwardPair() const;

  const ReadPair&                    pair;
  const std::vector<GenomeInterval>& breakpoints;
  /// \brief from the start of the first breakpoint to the end of the last
  GenomeInterval         svSpan;
  const InsertSizeStats& stats;
  double                 maxErrorRate;
};

typedef bool (*ReadPairRulePredicate)(const ReadPairRuleContext& context);

/// \brief One entry of an ordered classification rule table
struct ReadPairRule {
  /// description written to the debug log when this rule decides a pair
  const char*           label;
  ReadPairRulePredicate predicate;
  PAIR_CLASS::index_t   outcome;
};

/// \brief Get the ordered classification rules for an SV type
///
/// Insertion and deletion calls have their own rule tables, any other type uses the control rule, which
/// only recognizes concordant pairs.
const std::vector<ReadPairRule>& getReadPairRules(const SV_EVENT::index_t svType);

/// \brief Classify a read pair with the first rule of \p rules whose predicate is true
///
/// \param[out] matchedRule The deciding rule, or nullptr if the pair is unclassified
PAIR_CLASS::index_t classifyReadPair(
    const std::vector<ReadPairRule>& rules,
    const ReadPairRuleContext&       context,
    const ReadPairRule*&             matchedRule);

/// \brief Counts of read pairs classified for one SV in one sample
struct ReadPairClassification {
  unsigned concordant = 0;
  unsigned discordant = 0;
};

/// \brief The reads sharing one read name, as BAM records and as a sorted read pair
struct ReadPairRecords {
  std::vector<bam_record> records;
  ReadPair                pair;
};

/// \brief Fetch and classify the read pairs around an SV's breakpoints
///
struct ReadPairClassifier {
  /// \param debugLogPtr Stream for per-pair decision messages, nullptr disables these
  explicit ReadPairClassifier(const ReadPairClassifierOptions& opt, std::ostream* debugLogPtr = nullptr)
    : _opt(opt), _debugLogPtr(debugLogPtr)
  {
  }

  /// \brief Collect all read pairs overlapping the fetch regions of one sample
  ///
  /// Secondary and supplementary reads are dropped, a read found in more than one fetch region is kept once.
  /// Read pairs are returned in read name order.
  ///
  /// \param[in] bamHeader Chromosome table that the fetch region chromosome indices refer to
  void collectReadPairs(
      Sample&                            sample,
      const bam_header_info&             bamHeader,
      const std::vector<GenomeInterval>& fetchRegions,
      std::vector<ReadPairRecords>&      readPairs) const;

  /// \brief Classify the read pairs of one sample around the breakpoints of one SV
  ///
  /// \param[in] fetchRegions Padded and merged breakpoint regions to collect reads from
  /// \param[in] breakpoints Unpadded breakpoint intervals used by the classification rules
  /// \param[in] evidenceWriterPtr If not nullptr, all reads of concordant and discordant pairs are written
  /// here
  ReadPairClassification classify(
      Sample&                            sample,
      const bam_header_info&             bamHeader,
      const std::vector<GenomeInterval>& fetchRegions,
      const std::vector<GenomeInterval>& breakpoints,
      const SV_EVENT::index_t            svType,
      PairEvidenceWriter*                evidenceWriterPtr) const;

private:
  const ReadPairClassifierOptions _opt;
  std::ostream*                   _debugLogPtr;
};

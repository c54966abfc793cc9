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

#include "htsapi/bam_dumper.hpp"
#include "htsapi/bam_header_info.hpp"
#include "htsapi/bam_record.hpp"

#include "boost/utility.hpp"

#include <memory>
#include <string>
#include <vector>

/// \brief Write the reads of every concordant pair and every discordant pair to two BAM files
///
/// Reads from any alignment file can be written. Their chromosome indices are translated by name to
/// the output header.
struct PairEvidenceWriter : private boost::noncopyable {
  /// \param header BAM header used for both output files, this is copied
  PairEvidenceWriter(
      const std::string& concordantFilename, const std::string& discordantFilename, const bam_hdr_t& header);

  ~PairEvidenceWriter();

  /// \param readHeader Header of the alignment file the reads were taken from
  void writeConcordantReads(const std::vector<bam_record>& reads, const bam_hdr_t& readHeader)
  {
    writeReads(reads, readHeader, *_concordantDumper);
  }

  /// \param readHeader Header of the alignment file the reads were taken from
  void writeDiscordantReads(const std::vector<bam_record>& reads, const bam_hdr_t& readHeader)
  {
    writeReads(reads, readHeader, *_discordantDumper);
  }

  /// \brief Close both output files
  void close();

private:
  void writeReads(
      const std::vector<bam_record>& reads, const bam_hdr_t& readHeader, bam_dumper& dumper) const;

  /// \return Output header index of chromosome tid from readHeader
  int32_t getOutputTargetId(const int32_t tid, const bam_hdr_t& readHeader) const;

  bam_hdr_t*                  _header;
  bam_header_info             _headerInfo;
  std::unique_ptr<bam_dumper> _concordantDumper;
  std::unique_ptr<bam_dumper> _discordantDumper;
};

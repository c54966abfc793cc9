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

#include "svgt/PairEvidenceWriter.hpp"
#include "common/Exceptions.hpp"

#include <sstream>

PairEvidenceWriter::PairEvidenceWriter(
    const std::string& concordantFilename, const std::string& discordantFilename, const bam_hdr_t& header)
  : _header(bam_hdr_dup(&header))
{
  if (nullptr == _header) {
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException("Failed to copy BAM header for evidence output"));
  }
  try {
    _headerInfo = bam_header_info(*_header);
    _concordantDumper.reset(new bam_dumper(concordantFilename.c_str(), *_header));
    _discordantDumper.reset(new bam_dumper(discordantFilename.c_str(), *_header));
  } catch (...) {
    _concordantDumper.reset();
    bam_hdr_destroy(_header);
    throw;
  }
}

PairEvidenceWriter::~PairEvidenceWriter()
{
  // dumpers must be closed before the header they refer to is released
  _concordantDumper.reset();
  _discordantDumper.reset();
  bam_hdr_destroy(_header);
}

void PairEvidenceWriter::close()
{
  _concordantDumper->close();
  _discordantDumper->close();
}

int32_t PairEvidenceWriter::getOutputTargetId(const int32_t tid, const bam_hdr_t& readHeader) const
{
  if (tid < 0) return tid;
  if (tid >= readHeader.n_targets) {
    std::ostringstream oss;
    oss << "Read chromosome index " << tid << " is not in the alignment file header";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }

  const char*   chromName(readHeader.target_name[tid]);
  const int32_t outputTid(_headerInfo.getChromIndex(chromName));
  if (outputTid < 0) {
    std::ostringstream oss;
    oss << "Chromosome '" << chromName << "' is not found in the evidence BAM header";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }
  return outputTid;
}

void PairEvidenceWriter::writeReads(
    const std::vector<bam_record>& reads, const bam_hdr_t& readHeader, bam_dumper& dumper) const
{
  bam_record outputRead;
  for (const bam_record& read : reads) {
    outputRead = read;
    outputRead.set_target_id(getOutputTargetId(read.target_id(), readHeader));
    outputRead.set_mate_target_id(getOutputTargetId(read.mate_target_id(), readHeader));
    dumper.put_record(outputRead.get_data());
  }
}

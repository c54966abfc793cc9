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

#include "testAlignmentDataUtil.hpp"

#include "blt_util/align_path.hpp"
#include "common/Exceptions.hpp"
#include "htsapi/AlignedRead_bam_util.hpp"
#include "htsapi/align_path_bam_util.hpp"
#include "htsapi/bam_dumper.hpp"

#include <cstdlib>
#include <cstring>

#include <memory>
#include <sstream>

bam_header_info buildTestBamHeader()
{
  return buildTestBamHeader(
      {bam_header_info::chrom_info("chrFoo", 5000), bam_header_info::chrom_info("chrBar", 5000)});
}

bam_header_info buildTestBamHeader(const std::vector<bam_header_info::chrom_info>& chromData)
{
  bam_header_info bamHeader;
  bamHeader.chrom_data = chromData;

  int32_t chromIndex(0);
  for (const auto& chromData : bamHeader.chrom_data) {
    bamHeader.chrom_to_index.insert(std::make_pair(chromData.label, chromIndex));
    chromIndex++;
  }
  return bamHeader;
}

HtslibBamHeaderManager::HtslibBamHeaderManager(const std::vector<bam_header_info::chrom_info>& chromData)
  : _header(bam_hdr_init())
{
  _header->n_targets   = chromData.size();
  _header->target_len  = (uint32_t*)calloc(_header->n_targets, sizeof(uint32_t));
  _header->target_name = (char**)calloc(_header->n_targets, sizeof(char*));
  for (int i = 0; i < _header->n_targets; ++i) {
    _header->target_len[i]  = chromData[i].length;
    _header->target_name[i] = strdup(chromData[i].label.c_str());
  }
}

HtslibBamHeaderManager::~HtslibBamHeaderManager()
{
  bam_hdr_destroy(_header);
}

void buildTestBamFile(
    const bam_header_info&         bamHeader,
    const std::vector<bam_record>& readsToAdd,
    const std::string&             bamFilename)
{
  const HtslibBamHeaderManager bamHeaderManager(bamHeader.chrom_data);
  bam_dumper                   bamDumper(bamFilename.c_str(), bamHeaderManager.get());
  for (const bam_record& bamRecord : readsToAdd) {
    bamDumper.put_record(bamRecord.get_data());
  }
  bamDumper.close();

  const int indexStatus = bam_index_build(bamFilename.c_str(), 0);
  if (indexStatus < 0) {
    std::ostringstream oss;
    oss << "Failed to build index for bam file. bam_index_build return code: " << indexStatus
        << " bam filename: '" << bamFilename << "'\n";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }
}

void readTestBamFile(
    const std::string& bamFilename, bam_header_info& bamHeader, std::vector<bam_record>& reads)
{
  reads.clear();

  htsFile* hfp(hts_open(bamFilename.c_str(), "rb"));
  if (nullptr == hfp) {
    std::ostringstream oss;
    oss << "Failed to open test bam file: '" << bamFilename << "'";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }

  bam_hdr_t* header(sam_hdr_read(hfp));
  if (nullptr == header) {
    hts_close(hfp);
    std::ostringstream oss;
    oss << "Failed to read header of test bam file: '" << bamFilename << "'";
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }
  bamHeader = bam_header_info(*header);

  bam_record bamRead;
  int        readStatus(0);
  while ((readStatus = sam_read1(hfp, header, bamRead.get_data())) >= 0) {
    reads.push_back(bamRead);
  }

  bam_hdr_destroy(header);
  hts_close(hfp);

  // -1 is the end of file, any other negative value is an error
  if (readStatus < -1) {
    std::ostringstream oss;
    oss << "Failed to read test bam file: '" << bamFilename << "' sam_read1 return code: " << readStatus;
    BOOST_THROW_EXCEPTION(svgt::common::GeneralException(oss.str()));
  }
}

void buildTestBamRecord(
    bam_record&        bamRead,
    int                targetID,
    int                pos,
    int                mateTargetID,
    int                matePos,
    int                readLength,
    int                mapQ,
    std::string        cigarString,
    int                fragmentSize,
    int                editDistance,
    const std::string& qname)
{
  bam1_t& bamData(*(bamRead.get_data()));

  edit_bam_qname(qname.c_str(), bamData);

  // set CIGAR
  {
    if (cigarString.empty()) {
      cigarString = std::to_string(readLength) + "M";
    }

    ALIGNPATH::path_t inputPath;
    cigar_to_apath(cigarString.c_str(), inputPath);
    edit_bam_cigar(inputPath, bamData);
  }

  // set read and qual
  {
    const std::string querySeq(readLength, 'A');
    const unsigned    querySize(querySeq.length());
    // initialize test qual array to all Q30's:
    std::unique_ptr<uint8_t[]> qual(new uint8_t[querySize]);
    for (unsigned i(0); i < querySize; ++i) {
      qual[i] = 30;
    }
    edit_bam_read_and_quality(querySeq.c_str(), qual.get(), bamData);
  }

  // Set some defaults for the read
  bamRead.toggle_is_paired();
  bamRead.toggle_is_first();
  bamRead.toggle_is_mate_fwd_strand();
  bamData.core.pos   = pos;
  bamData.core.isize = fragmentSize;
  bamData.core.qual  = mapQ;
  bamRead.set_target_id(targetID);

  // Set mate info
  bamData.core.mtid = mateTargetID;
  bamData.core.mpos = matePos;

  if (editDistance >= 0) {
    static const char nmTag[] = {'N', 'M'};
    bam_aux_append_unsigned(bamData, nmTag, editDistance);
  }
}

void makeSecondReadOfPair(bam_record& bamRead)
{
  bamRead.toggle_is_first();
  bamRead.toggle_is_second();
  bamRead.toggle_is_fwd_strand();
  bamRead.toggle_is_mate_fwd_strand();
  changeTemplateSize(bamRead, -bamRead.template_size());
}

AlignedRead buildTestAlignedRead(
    int                pos,
    const std::string& cigarString,
    bool               isReverse,
    int                editDistance,
    int                mapQ,
    int                fragmentSize,
    int                targetID)
{
  ALIGNPATH::path_t path;
  cigar_to_apath(cigarString.c_str(), path);
  const int readLength(ALIGNPATH::apath_read_length(path));

  bam_record bamRead;
  buildTestBamRecord(
      bamRead, targetID, pos, targetID, pos, readLength, mapQ, cigarString, fragmentSize, editDistance);
  if (isReverse) bamRead.toggle_is_fwd_strand();
  return getAlignedRead(bamRead);
}

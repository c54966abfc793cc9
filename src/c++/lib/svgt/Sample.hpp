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

#include "htsapi/bam_streamer.hpp"
#include "options/ReadPairClassifierOptions.hpp"
#include "svgt/ControlRegion.hpp"
#include "svgt/InsertSizeStats.hpp"

#include "boost/utility.hpp"

#include <memory>
#include <string>
#include <vector>

/// \brief An input alignment file together with the insert size statistics estimated for it
///
/// The insert size statistics are fixed on construction.
struct Sample : private boost::noncopyable {
  /// \brief Open the alignment file and estimate insert size statistics from the copy number 2 regions
  Sample(
      const std::string&                filename,
      const std::vector<ControlRegion>& copyTwoRegions,
      const ReadPairClassifierOptions&  opt);

  /// \brief Open the alignment file with known insert size statistics
  Sample(const std::string& filename, const InsertSizeStats& stats);

  const std::string& name() const { return _filename; }

  bam_streamer& getStream() { return *_streamPtr; }

  const bam_hdr_t& getHeader() const { return _streamPtr->get_header(); }

  const InsertSizeStats& getInsertSizeStats() const { return _stats; }

private:
  std::string                   _filename;
  std::unique_ptr<bam_streamer> _streamPtr;
  InsertSizeStats               _stats;
};

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

/// \brief Genotype SV calls from concordant and discordant read pair counts in each alignment file
struct GenotypeSVCalls : public svgt::Program {
  const char* name() const { return "GenotypeSVCalls"; }

  void runInternal(int argc, char* argv[]) const;
};

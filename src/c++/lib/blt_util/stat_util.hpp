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

#include <vector>

/// \brief Median of a set of observations
///
/// For an even number of observations the two central values are averaged.
///
/// \param[in] obs Observations, cannot be empty
double getMedian(std::vector<int> obs);

/// \brief Standard deviation of a set of observations, normalized by the observation count
///
/// \param[in] obs Observations, cannot be empty
double getPopulationStdDev(const std::vector<int>& obs);

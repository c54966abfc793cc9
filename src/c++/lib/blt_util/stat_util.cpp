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

#include "blt_util/stat_util.hpp"
#include "blt_util/blt_exception.hpp"

#include <algorithm>
#include <cmath>

static void checkNonEmpty(const std::vector<int>& obs, const char* label)
{
  if (obs.empty()) {
    throw blt_exception((std::string("Can't compute ") + label + " of an empty observation set").c_str());
  }
}

double getMedian(std::vector<int> obs)
{
  checkNonEmpty(obs, "median");

  const unsigned halfSize(obs.size() / 2);
  std::nth_element(obs.begin(), obs.begin() + halfSize, obs.end());
  const double upperMid(obs[halfSize]);
  if (obs.size() % 2) return upperMid;

  // lower middle value is the max of the lower partition:
  const double lowerMid(*std::max_element(obs.begin(), obs.begin() + halfSize));
  return ((lowerMid + upperMid) / 2.);
}

double getPopulationStdDev(const std::vector<int>& obs)
{
  checkNonEmpty(obs, "standard deviation");

  // Accumulate mean and variance with a single pass, following Higham,
  // Accuracy & Stability of Numerical Algorithms, p.26
  double   M(0);
  double   Q(0);
  unsigned k(0);
  for (const int val : obs) {
    k++;
    const double x(val);
    const double delta(x - M);
    M += delta / static_cast<double>(k);
    Q += delta * (x - M);
  }
  return std::sqrt(Q / static_cast<double>(k));
}

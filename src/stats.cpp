// SPDX-License-Identifier: MIT

#include "pcgrandom/stats.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace pcgr {

std::vector<std::size_t> histogram_below(Pcg32& g, uint32_t max, std::size_t draws){
  std::vector<std::size_t> counts(std::max<uint32_t>(max, 1u), 0);
  for (std::size_t i = 0; i < draws; ++i) ++counts[g.next_bounded(max)];
  return counts;
}

double chi_squared_uniform(const std::vector<std::size_t>& counts){
  if (counts.empty()) return 0.0;
  const double total = (double)std::accumulate(counts.begin(), counts.end(), std::size_t(0));
  if (total == 0.0) return 0.0;
  const double expected = total / (double)counts.size();
  double chi2 = 0.0;
  for (auto c : counts){ double d = (double)c - expected; chi2 += d * d / expected; }
  return chi2;
}

double max_relative_deviation(const std::vector<std::size_t>& counts){
  if (counts.empty()) return 0.0;
  const double total = (double)std::accumulate(counts.begin(), counts.end(), std::size_t(0));
  if (total == 0.0) return 0.0;
  const double p = 1.0 / (double)counts.size();
  double worst = 0.0;
  for (auto c : counts) worst = std::max(worst, std::fabs((double)c / total - p) / p);
  return worst;
}

} // namespace pcgr

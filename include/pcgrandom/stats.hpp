// SPDX-License-Identifier: MIT

#pragma once
#include "pcg32.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pcgr {

// counts[v] = number of next_bounded(max) draws equal to v.
std::vector<std::size_t> histogram_below(Pcg32& g, uint32_t max, std::size_t draws);

// Pearson statistic against equal expected counts; k-1 degrees of freedom.
double chi_squared_uniform(const std::vector<std::size_t>& counts);

// max over v of |freq(v) - 1/k| / (1/k). 0 for empty input.
double max_relative_deviation(const std::vector<std::size_t>& counts);

} // namespace pcgr

// SPDX-License-Identifier: MIT

#pragma once
#include "pcg32.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pcgr {

// Stream of row k. Step of 2 keeps increments distinct after the low bit is forced on.
inline uint64_t stream_for_index(uint64_t first_stream, std::size_t k){
  return first_stream + 2u * (uint64_t)k;
}

// nstreams x count raw draws, row-major. Row k comes from Pcg32(seed, stream_for_index(first_stream, k)).
// With PCGR_OPENMP rows are filled in parallel, each by its own engine; output does not change.
// Throws std::length_error when nstreams * count does not fit in size_t.
std::vector<uint32_t> generate_streams(uint64_t seed, uint64_t first_stream, std::size_t nstreams, std::size_t count);

} // namespace pcgr

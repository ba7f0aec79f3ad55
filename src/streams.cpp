// SPDX-License-Identifier: MIT

#include "pcgrandom/streams.hpp"
#include <limits>
#include <stdexcept>
#ifdef PCGR_OPENMP
#include <omp.h>
#endif

namespace pcgr {

std::vector<uint32_t> generate_streams(uint64_t seed, uint64_t first_stream, std::size_t nstreams, std::size_t count){
  if (count == 0 || nstreams == 0) return {};
  if (nstreams > std::numeric_limits<std::size_t>::max() / count)
    throw std::length_error("generate_streams: nstreams * count overflows");
  std::vector<uint32_t> out(nstreams * count);
  const long long rows = (long long)nstreams;
#ifdef PCGR_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (long long k = 0; k < rows; ++k){
    Pcg32 g(seed, stream_for_index(first_stream, (std::size_t)k));
    uint32_t* row = out.data() + (std::size_t)k * count;
    for (std::size_t i = 0; i < count; ++i) row[i] = g.next_u32();
  }
  return out;
}

} // namespace pcgr

// SPDX-License-Identifier: MIT

#pragma once
#include "pcgrandom/pcg32.hpp"
#ifdef PCGR_MPI
#include <mpi.h>
#endif
#include <optional>

namespace pcgr {

struct RankContext {
  int rank=0, size=1;
};

// Initializes MPI if needed. std::nullopt when built without PCGR_MPI.
std::optional<RankContext> init_rank_context();
void finalize_rank_context();

// Engine for this rank: same seed everywhere, stream_for_index(first_stream, rank),
// so ranks draw from disjoint streams.
Pcg32 rank_generator(const RankContext& ctx, uint64_t seed, uint64_t first_stream = Pcg32::DEFAULT_STREAM);

} // namespace pcgr

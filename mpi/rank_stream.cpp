// SPDX-License-Identifier: MIT

#include "mpi/rank_stream.hpp"
#include "pcgrandom/streams.hpp"

namespace pcgr {

std::optional<RankContext> init_rank_context(){
#ifndef PCGR_MPI
  return std::nullopt;
#else
  int inited=0; MPI_Initialized(&inited);
  if (!inited){ int argc=0; char** argv=nullptr; MPI_Init(&argc,&argv); }
  RankContext ctx;
  MPI_Comm_rank(MPI_COMM_WORLD,&ctx.rank); MPI_Comm_size(MPI_COMM_WORLD,&ctx.size);
  return ctx;
#endif
}

void finalize_rank_context(){
#ifdef PCGR_MPI
  int finalized=0; MPI_Finalized(&finalized);
  if (!finalized) MPI_Finalize();
#endif
}

Pcg32 rank_generator(const RankContext& ctx, uint64_t seed, uint64_t first_stream){
  return Pcg32(seed, stream_for_index(first_stream, (std::size_t)ctx.rank));
}

} // namespace pcgr

// SPDX-License-Identifier: MIT

#include "pcgrandom/c_api.h"
#include "pcgrandom/errors.hpp"
#include "pcgrandom/pcg32.hpp"
#include <new>

struct pcgr_rng {
  pcgr::Pcg32 gen;
};

extern "C" {

pcgr_rng* pcgr_create(uint64_t seed, uint64_t stream){
  return new (std::nothrow) pcgr_rng{pcgr::Pcg32(seed, stream)};
}

pcgr_rng* pcgr_create_clock(uint64_t stream){
  return new (std::nothrow) pcgr_rng{pcgr::Pcg32::from_clock(stream)};
}

void pcgr_destroy(pcgr_rng* rng){ delete rng; }

uint32_t pcgr_next_u32(pcgr_rng* rng){ return rng ? rng->gen.next_u32() : 0; }
int32_t pcgr_next(pcgr_rng* rng){ return rng ? rng->gen.next() : 0; }
double pcgr_sample(pcgr_rng* rng){ return rng ? rng->gen.sample() : 0.0; }

int pcgr_next_below(pcgr_rng* rng, int32_t max, int32_t* out){
  if (!rng) return PCGR_ERR_NULL_HANDLE;
  if (!out) return PCGR_ERR_NULL_OUT;
  try { *out = rng->gen.next_below(max); }
  catch (const pcgr::InvalidArgument&) { return PCGR_ERR_INVALID_ARGUMENT; }
  return PCGR_OK;
}

int pcgr_next_in_range(pcgr_rng* rng, int32_t min, int32_t max, int32_t* out){
  if (!rng) return PCGR_ERR_NULL_HANDLE;
  if (!out) return PCGR_ERR_NULL_OUT;
  try { *out = rng->gen.next_in_range(min, max); }
  catch (const pcgr::InvalidArgument&) { return PCGR_ERR_INVALID_ARGUMENT; }
  return PCGR_OK;
}

int pcgr_fill_bytes(pcgr_rng* rng, uint8_t* buffer, size_t size){
  if (!rng) return PCGR_ERR_NULL_HANDLE;
  try { rng->gen.fill_bytes(buffer, size); }
  catch (const pcgr::NullBuffer&) { return PCGR_ERR_NULL_BUFFER; }
  return PCGR_OK;
}

const char* pcgr_version(void){
#ifdef PCGR_VERSION
  return PCGR_VERSION;
#else
  return "unknown";
#endif
}

} // extern "C"

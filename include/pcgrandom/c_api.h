// SPDX-License-Identifier: MIT

#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct pcgr_rng pcgr_rng;

enum {
  PCGR_OK = 0,
  PCGR_ERR_NULL_HANDLE = 1,
  PCGR_ERR_INVALID_ARGUMENT = 2,
  PCGR_ERR_NULL_BUFFER = 3,
  PCGR_ERR_NULL_OUT = 4
};

// Creates a generator; release with pcgr_destroy(). Returns NULL on allocation failure.
pcgr_rng* pcgr_create(uint64_t seed, uint64_t stream);

// Clock-seeded generator. Generators created in quick succession may share a seed;
// pass distinct streams if they must differ.
pcgr_rng* pcgr_create_clock(uint64_t stream);

void pcgr_destroy(pcgr_rng* rng);

// Draws return 0 when rng is NULL.
uint32_t pcgr_next_u32(pcgr_rng* rng);
int32_t pcgr_next(pcgr_rng* rng);
double pcgr_sample(pcgr_rng* rng);

// Return a PCGR_* status; *out is written only on PCGR_OK. A NULL out is
// PCGR_ERR_NULL_OUT; PCGR_ERR_NULL_BUFFER is reserved for pcgr_fill_bytes.
int pcgr_next_below(pcgr_rng* rng, int32_t max, int32_t* out);
int pcgr_next_in_range(pcgr_rng* rng, int32_t min, int32_t max, int32_t* out);
int pcgr_fill_bytes(pcgr_rng* rng, uint8_t* buffer, size_t size);

// Returns the compiled library version string.
const char* pcgr_version(void);

#ifdef __cplusplus
}
#endif

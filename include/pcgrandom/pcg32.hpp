// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>
#include <cstddef>
#include <span>

namespace pcgr {

// PCG32 (64-bit state, 32-bit output, XSH-RR permutation).
// Not cryptographically secure: the state can be recovered from outputs.
// A single instance must not be shared between threads without external locking;
// give each thread its own engine with a distinct stream instead.
class Pcg32 {
  uint64_t state_;
  uint64_t inc_;

public:
  static constexpr uint64_t MULTIPLIER = 6364136223846793005ULL;
  static constexpr uint64_t DEFAULT_STREAM = 1442695040888963407ULL;
  static constexpr double INVERSE_MAX = 1.0 / 4294967295.0;

  // Seeds from the steady (monotonic) clock tick count, default stream.
  //
  // The clock has finite resolution: engines constructed in rapid succession
  // without an explicit seed may receive the same seed and produce identical
  // sequences. Callers needing independent unseeded engines must supply
  // distinct streams (see from_clock) or explicit seeds.
  Pcg32();

  // Same sequence for the same (seed, stream) pair. The low bit of stream is forced on.
  explicit Pcg32(uint64_t seed, uint64_t stream = DEFAULT_STREAM) : state_(seed), inc_(stream | 1ULL) {}

  // Clock-seeded engine on an explicit stream. Same resolution caveat as Pcg32().
  static Pcg32 from_clock(uint64_t stream);

  uint64_t state() const { return state_; }
  uint64_t increment() const { return inc_; }

  // Raw 32-bit output; every other draw is built on this.
  uint32_t next_u32(){
    uint64_t old = state_;
    state_ = old * MULTIPLIER + inc_;
    uint32_t xorshifted = (uint32_t)(((old >> 18u) ^ old) >> 27u);
    uint32_t rot = (uint32_t)(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
  }
  uint32_t operator()(){ return next_u32(); }

  // Uniform in [0, max) without modulo bias. max == 0 returns 0 and draws nothing.
  uint32_t next_bounded(uint32_t max);

  // Non-negative value in [0, INT32_MAX].
  int32_t next(){ return (int32_t)(next_u32() >> 1); }

  // [0, max). Throws InvalidArgument when max < 0.
  int32_t next_below(int32_t max);

  // [min, max). Returns min without drawing when min == max.
  // Throws InvalidArgument when min > max.
  int32_t next_in_range(int32_t min, int32_t max);

  // Little-endian unpacking of raw draws, one draw per 4 bytes; the last 1..4 bytes
  // (or none, for an empty buffer) always take one more draw.
  // Throws NullBuffer when buffer is null.
  void fill_bytes(uint8_t* buffer, std::size_t size);
  // A span is never absent; an empty one behaves like an empty buffer.
  void fill_bytes(std::span<uint8_t> buffer);

  // [0, 1). A raw draw of UINT32_MAX is rejected and redrawn, so 1.0 never occurs.
  double sample();
  double next_double(){ return sample(); }

  bool operator==(const Pcg32& o) const { return state_ == o.state_ && inc_ == o.inc_; }
};

} // namespace pcgr

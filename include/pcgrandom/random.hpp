// SPDX-License-Identifier: MIT

#pragma once
#include "pcg32.hpp"
#include <cstdint>
#include <limits>

namespace pcgr {
// UniformRandomBitGenerator view of a Pcg32, for <random> distributions
// and std::shuffle. Owns its engine; no inheritance involved.
class Rng {
  Pcg32 gen;
public:
  using result_type = uint32_t;
  Rng() = default;
  explicit Rng(uint64_t seed, uint64_t stream = Pcg32::DEFAULT_STREAM) : gen(seed, stream) {}
  explicit Rng(const Pcg32& engine) : gen(engine) {}
  static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
  static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }
  result_type operator()() { return gen.next_u32(); }
  double uniform() { return gen.sample(); }
  Pcg32& engine() { return gen; }
  const Pcg32& engine() const { return gen; }
};
}

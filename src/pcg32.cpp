// SPDX-License-Identifier: MIT

#include "pcgrandom/pcg32.hpp"
#include "pcgrandom/errors.hpp"
#include <chrono>
#include <limits>
#include <string>

namespace pcgr {

static uint64_t clock_seed(){
  return (uint64_t)std::chrono::steady_clock::now().time_since_epoch().count();
}

Pcg32::Pcg32() : Pcg32(clock_seed(), DEFAULT_STREAM) {}

Pcg32 Pcg32::from_clock(uint64_t stream){ return Pcg32(clock_seed(), stream); }

uint32_t Pcg32::next_bounded(uint32_t max){
  if (max == 0) return 0;
  // Draws below threshold would make low residues more likely.
  const uint32_t threshold = (std::numeric_limits<uint32_t>::max() - max) % max;
  for (;;){
    uint32_t r = next_u32();
    if (r >= threshold) return r % max;
  }
}

int32_t Pcg32::next_below(int32_t max){
  if (max < 0) throw InvalidArgument("max", max, std::to_string(max) + " is less than 0");
  return (int32_t)next_bounded((uint32_t)max);
}

int32_t Pcg32::next_in_range(int32_t min, int32_t max){
  if (min > max) throw InvalidArgument("min", min, "min is greater than max (" + std::to_string(min) + " > " + std::to_string(max) + ")");
  if (min == max) return min;
  // Span and result wrap modulo 2^32, so [INT32_MIN, INT32_MAX) works too.
  const uint32_t span = (uint32_t)max - (uint32_t)min;
  return (int32_t)(next_bounded(span) + (uint32_t)min);
}

void Pcg32::fill_bytes(uint8_t* buffer, std::size_t size){
  if (!buffer) throw NullBuffer("buffer");
  std::size_t i = 0;
  for (; size - i > 4; i += 4){
    uint32_t pack = next_u32();
    buffer[i + 0] = (uint8_t)(pack & 0xFF);
    buffer[i + 1] = (uint8_t)((pack >> 8) & 0xFF);
    buffer[i + 2] = (uint8_t)((pack >> 16) & 0xFF);
    buffer[i + 3] = (uint8_t)((pack >> 24) & 0xFF);
  }
  // Tail of 1..4 bytes (none for an empty buffer) always costs one draw.
  for (uint32_t pack = next_u32(); i < size; ++i, pack >>= 8){
    buffer[i] = (uint8_t)(pack & 0xFF);
  }
}

void Pcg32::fill_bytes(std::span<uint8_t> buffer){
  uint8_t none = 0;
  fill_bytes(buffer.empty() ? &none : buffer.data(), buffer.size());
}

double Pcg32::sample(){
  for (;;){
    uint32_t r = next_u32();
    if (r != std::numeric_limits<uint32_t>::max()) return INVERSE_MAX * r;
  }
}

} // namespace pcgr

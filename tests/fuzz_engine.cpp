// SPDX-License-Identifier: MIT

#include "pcgrandom/errors.hpp"
#include "pcgrandom/pcg32.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <vector>

using namespace pcgr;

// Input: seed (8 bytes), stream (8), min (4), max (4), byte count (1).
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  if (size < 25) return 0;
  uint64_t seed, stream; int32_t lo, hi;
  std::memcpy(&seed, data, 8); std::memcpy(&stream, data+8, 8);
  std::memcpy(&lo, data+16, 4); std::memcpy(&hi, data+20, 4);
  std::size_t nbytes = data[24];

  Pcg32 a(seed, stream), b(seed, stream);
  if ((a.increment() & 1u) == 0) std::abort();
  try {
    int32_t v = a.next_in_range(lo, hi);
    if (lo > hi) std::abort();
    if (lo < hi && (v < lo || v >= hi)) std::abort();
    if (lo == hi && v != lo) std::abort();
  } catch (const InvalidArgument&) {
    if (lo <= hi) std::abort();
  }
  try {
    int32_t v = a.next_below(hi);
    if (hi < 0) std::abort();
    if (hi > 0 && (v < 0 || v >= hi)) std::abort();
  } catch (const InvalidArgument&) {
    if (hi >= 0) std::abort();
  }
  std::vector<uint8_t> buf(nbytes + 1);
  a.fill_bytes(buf.data(), nbytes);
  double s = a.sample();
  if (!(s >= 0.0 && s < 1.0)) std::abort();

  // Replaying the same calls on a twin reproduces the state.
  try { b.next_in_range(lo, hi); } catch (const InvalidArgument&) {}
  try { b.next_below(hi); } catch (const InvalidArgument&) {}
  std::vector<uint8_t> buf2(nbytes + 1);
  b.fill_bytes(buf2.data(), nbytes);
  b.sample();
  if (!(a == b) || buf != buf2) std::abort();
  return 0;
}

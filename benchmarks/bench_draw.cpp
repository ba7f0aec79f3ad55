// SPDX-License-Identifier: MIT

#include "pcgrandom/pcg32.hpp"
#include "pcgrandom/streams.hpp"
#include <chrono>
#include <iostream>
#include <vector>

using namespace pcgr;

int main(){
  const std::size_t n = 100000000;
  Pcg32 g(42, 54);
  uint32_t acc = 0;
  auto t0 = std::chrono::steady_clock::now();
  for (std::size_t i=0;i<n;++i) acc ^= g.next_u32();
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "next_u32: " << n/dt.count()/1e6 << " M/s (" << acc << ")\n";

  t0 = std::chrono::steady_clock::now();
  for (std::size_t i=0;i<n;++i) acc ^= g.next_bounded(1000);
  t1 = std::chrono::steady_clock::now(); dt = t1 - t0;
  std::cout << "next_bounded(1000): " << n/dt.count()/1e6 << " M/s (" << acc << ")\n";

  std::vector<uint8_t> buf(1 << 20);
  t0 = std::chrono::steady_clock::now();
  for (int i=0;i<64;++i) g.fill_bytes(buf);
  t1 = std::chrono::steady_clock::now(); dt = t1 - t0;
  std::cout << "fill_bytes: " << 64.0/dt.count() << " MiB/s\n";

  t0 = std::chrono::steady_clock::now();
  auto block = generate_streams(42, 54, 64, 1 << 20);
  t1 = std::chrono::steady_clock::now(); dt = t1 - t0;
  std::cout << "generate_streams 64x1M: " << dt.count() << " s (" << block.back() << ")\n";
  return 0;
}

// SPDX-License-Identifier: MIT

#include "pcgrandom/pcg32.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

using namespace pcgr;

static int tests_failed = 0;
#define EXPECT_TRUE(c) do{ if (!(c)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

// State whose next raw output is 0xFFFFFFFF: rotation 0 and all ones in bits 27..58
// after the xorshift.
static const uint64_t MAX_OUTPUT_STATE = 0x07fffe00078001e0ULL;

int main(){
  {
    Pcg32 g(MAX_OUTPUT_STATE);
    EXPECT_TRUE(g.next_u32() == 0xFFFFFFFFu);
  }
  // The all-ones draw is skipped; the result comes from the following draw.
  {
    Pcg32 g(MAX_OUTPUT_STATE), ref(MAX_OUTPUT_STATE);
    ref.next_u32();
    uint32_t second = ref.next_u32();
    EXPECT_TRUE(second == 3986413068u);
    double s = g.sample();
    EXPECT_TRUE(s == Pcg32::INVERSE_MAX * second);
    EXPECT_TRUE(g == ref);
    EXPECT_NEAR(s, 0.9281591207087411, 1e-15);
  }
  {
    Pcg32 g(42, 54), ref(42, 54);
    EXPECT_TRUE(g.next_double() == 0.0);
    ref.next_u32();
    EXPECT_TRUE(g.sample() == Pcg32::INVERSE_MAX * ref.next_u32());
  }
  // Largest accepted draw stays below 1.
  EXPECT_TRUE(Pcg32::INVERSE_MAX * 4294967294.0 < 1.0);
  {
    Pcg32 g(0xC0FFEE, 17);
    double lo = 1.0, hi = 0.0, sum = 0.0;
    const int n = 10000000;
    int bad = 0;
    for (int i=0;i<n;++i){
      double s = g.sample();
      if (!(s >= 0.0 && s < 1.0)) ++bad;
      lo = std::min(lo, s); hi = std::max(hi, s); sum += s;
    }
    EXPECT_TRUE(bad == 0);
    EXPECT_TRUE(hi < 1.0);
    EXPECT_TRUE(lo < 1e-5);
    EXPECT_TRUE(hi > 1.0 - 1e-5);
    EXPECT_NEAR(sum / n, 0.5, 1e-3);
  }
  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}

// SPDX-License-Identifier: MIT

#pragma once
#include "pcg32.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pcgr {

enum class DrawMode { U32, INT, BELOW, RANGE, DOUBLE, BYTES };

struct DrawConfig {
  std::optional<uint64_t> seed; // unset: clock seed
  uint64_t stream = Pcg32::DEFAULT_STREAM;
  std::size_t count = 10;
  DrawMode mode = DrawMode::U32;
  int32_t min = 0;
  int32_t max = 100;
};

// Reads key=value lines; blank lines and lines starting with '#' are skipped.
// Later keys overwrite earlier ones. Returns false if the file cannot be opened.
bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv);

// Decimal, or hex with a 0x prefix. Surrounding spaces are ignored; signs are rejected.
bool parse_u64(const std::string& s, uint64_t& out);

std::optional<DrawMode> parse_draw_mode(const std::string& s);
const char* draw_mode_name(DrawMode m);

// Applies known keys (seed, stream, count, mode, min, max) on top of cfg.
// Unknown keys are an error so typos do not pass silently.
bool apply_config(const std::map<std::string,std::string>& kv, DrawConfig& cfg, std::string& err);

} // namespace pcgr

// SPDX-License-Identifier: MIT

#include "pcgrandom/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace pcgr {

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

bool parse_u64(const std::string& s, uint64_t& out){
  std::string t = trim(s);
  int base = 10;
  if (t.size() > 2 && t[0]=='0' && (t[1]=='x' || t[1]=='X')){ t = t.substr(2); base = 16; }
  if (t.empty()) return false;
  for (unsigned char c : t){
    if (base == 10 ? !std::isdigit(c) : !std::isxdigit(c)) return false;
  }
  try {
    out = (uint64_t)std::stoull(t, nullptr, base);
    return true;
  } catch(const std::out_of_range&) { return false; }
}

static bool parse_i32(const std::string& s, int32_t& out){
  try {
    std::size_t pos=0;
    long long v = std::stoll(s, &pos, 10);
    if (pos != s.size()) return false;
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) return false;
    out = (int32_t)v;
    return true;
  } catch(const std::exception&) { return false; }
}

bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv){
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)){
    line = trim(line);
    if (line.empty() || line[0]=='#') continue;
    auto p = line.find('=');
    if (p == std::string::npos) continue;
    kv[trim(line.substr(0,p))] = trim(line.substr(p+1));
  }
  return true;
}

std::optional<DrawMode> parse_draw_mode(const std::string& s){
  if (s=="u32") return DrawMode::U32;
  if (s=="int") return DrawMode::INT;
  if (s=="below") return DrawMode::BELOW;
  if (s=="range") return DrawMode::RANGE;
  if (s=="double") return DrawMode::DOUBLE;
  if (s=="bytes") return DrawMode::BYTES;
  return std::nullopt;
}

const char* draw_mode_name(DrawMode m){
  switch (m){
    case DrawMode::U32: return "u32";
    case DrawMode::INT: return "int";
    case DrawMode::BELOW: return "below";
    case DrawMode::RANGE: return "range";
    case DrawMode::DOUBLE: return "double";
    case DrawMode::BYTES: return "bytes";
  }
  return "?";
}

bool apply_config(const std::map<std::string,std::string>& kv, DrawConfig& cfg, std::string& err){
  for (const auto& [k, v] : kv){
    if (k=="seed"){
      uint64_t s; if (!parse_u64(v, s)) { err = "Invalid seed: " + v; return false; }
      cfg.seed = s;
    } else if (k=="stream"){
      if (!parse_u64(v, cfg.stream)) { err = "Invalid stream: " + v; return false; }
    } else if (k=="count"){
      uint64_t n; if (!parse_u64(v, n)) { err = "Invalid count: " + v; return false; }
      cfg.count = (std::size_t)n;
    } else if (k=="mode"){
      auto m = parse_draw_mode(v);
      if (!m) { err = "Unknown mode: " + v; return false; }
      cfg.mode = *m;
    } else if (k=="min"){
      if (!parse_i32(v, cfg.min)) { err = "Invalid min: " + v; return false; }
    } else if (k=="max"){
      if (!parse_i32(v, cfg.max)) { err = "Invalid max: " + v; return false; }
    } else {
      err = "Unknown config key: " + k;
      return false;
    }
  }
  return true;
}

} // namespace pcgr

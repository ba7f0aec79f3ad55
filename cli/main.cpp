// SPDX-License-Identifier: MIT

#include "pcgrandom/config.hpp"
#include "pcgrandom/errors.hpp"
#include "pcgrandom/pcg32.hpp"
#include "pcgrandom/stats.hpp"
#include "pcgrandom/streams.hpp"
#include "pcgrandom/c_api.h"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pcgr;

// Upper bound on the values buffered by one invocation (streams block, byte dump).
static const std::size_t MAX_STREAM_CELLS = std::size_t(1) << 28;

static void usage(){
  std::cerr <<
    "Usage: pcgr <command> [options]\n"
    "  draw    [--seed S] [--stream T] [--count N] [--mode u32|int|below|range|double|bytes]\n"
    "          [--min A] [--max B] [--out FILE] [--config FILE] [--verbose]\n"
    "  streams [--seed S] [--first-stream T] [--streams K] [--count N]\n"
    "  check   [--seed S] [--stream T] [--max M] [--draws N] [--tolerance F]\n"
    "  version\n";
}

static std::string hex_bytes(const std::vector<uint8_t>& b){
  std::ostringstream os; os << std::hex << std::setfill('0');
  for (auto v : b) os << std::setw(2) << (unsigned)v;
  return os.str();
}

static int cmd_draw(int argc, char** argv){
  DrawConfig cfg;
  std::map<std::string,std::string> flags;
  std::string config_path, outp;
  bool verbose=false;
  for (int i=2;i<argc;++i){
    std::string a=argv[i]; auto nx=[&](const char* n){ if(i+1>=argc){std::cerr<<"Missing "<<n<<"\n"; return std::string(); } return std::string(argv[++i]); };
    if (a=="--seed") flags["seed"]=nx("seed");
    else if (a=="--stream") flags["stream"]=nx("stream");
    else if (a=="--count") flags["count"]=nx("count");
    else if (a=="--mode") flags["mode"]=nx("mode");
    else if (a=="--min") flags["min"]=nx("min");
    else if (a=="--max") flags["max"]=nx("max");
    else if (a=="--out") outp=nx("out");
    else if (a=="--config") config_path=nx("config");
    else if (a=="--verbose") verbose=true;
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; return 2; }
  }
  std::string err;
  if (!config_path.empty()){
    std::map<std::string,std::string> kv;
    if (!load_config_kv(config_path, kv)){ std::cerr<<"Cannot open config file: "<<config_path<<"\n"; return 3; }
    if (!apply_config(kv, cfg, err)){ std::cerr<<config_path<<": "<<err<<"\n"; return 3; }
  }
  if (!apply_config(flags, cfg, err)){ std::cerr<<err<<"\n"; return 2; }

  Pcg32 g = cfg.seed ? Pcg32(*cfg.seed, cfg.stream) : Pcg32::from_clock(cfg.stream);
  if (verbose){
    std::cerr<<"seed="<<(cfg.seed ? std::to_string(*cfg.seed) : std::string("clock:")+std::to_string(g.state()))
             <<" stream="<<cfg.stream<<" increment="<<g.increment()
             <<" mode="<<draw_mode_name(cfg.mode)<<" count="<<cfg.count<<"\n";
  }

  std::ofstream of; std::ostream* os=&std::cout;
  if (!outp.empty()){ of.open(outp); if(!of){ std::cerr<<"Cannot open out file\n"; return 4; } os=&of; }
  *os << std::setprecision(17);
  try {
    if (cfg.mode==DrawMode::BYTES){
      if (cfg.count > MAX_STREAM_CELLS){ std::cerr<<"--count exceeds "<<MAX_STREAM_CELLS<<" bytes\n"; return 2; }
      std::vector<uint8_t> buf(cfg.count);
      g.fill_bytes(buf);
      *os << hex_bytes(buf) << "\n";
      return 0;
    }
    for (std::size_t i=0;i<cfg.count;++i){
      switch (cfg.mode){
        case DrawMode::U32: *os << g.next_u32(); break;
        case DrawMode::INT: *os << g.next(); break;
        case DrawMode::BELOW: *os << g.next_below(cfg.max); break;
        case DrawMode::RANGE: *os << g.next_in_range(cfg.min, cfg.max); break;
        case DrawMode::DOUBLE: *os << g.sample(); break;
        case DrawMode::BYTES: break;
      }
      *os << "\n";
    }
  } catch (const InvalidArgument& e){
    std::cerr<<"Invalid argument "<<e.param()<<"="<<e.value()<<": "<<e.what()<<"\n"; return 6;
  } catch (const NullBuffer& e){
    std::cerr<<e.what()<<"\n"; return 6;
  }
  return 0;
}

static int cmd_streams(int argc, char** argv){
  std::map<std::string,std::string> flags;
  std::size_t nstreams=4, count=8;
  for (int i=2;i<argc;++i){
    std::string a=argv[i]; auto nx=[&](const char* n){ if(i+1>=argc){std::cerr<<"Missing "<<n<<"\n"; return std::string(); } return std::string(argv[++i]); };
    if (a=="--seed") flags["seed"]=nx("seed");
    else if (a=="--first-stream") flags["stream"]=nx("first-stream");
    else if (a=="--count") flags["count"]=nx("count");
    else if (a=="--streams") flags["streams"]=nx("streams");
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; return 2; }
  }
  if (auto it=flags.find("streams"); it!=flags.end()){
    uint64_t n;
    if (!parse_u64(it->second, n)){ std::cerr<<"Invalid streams: "<<it->second<<"\n"; return 2; }
    nstreams = (std::size_t)n;
    flags.erase(it);
  }
  DrawConfig cfg; cfg.count = count; std::string err;
  if (!apply_config(flags, cfg, err)){ std::cerr<<err<<"\n"; return 2; }
  if (nstreams > MAX_STREAM_CELLS / std::max<std::size_t>(cfg.count, 1)){
    std::cerr<<"--streams x --count exceeds "<<MAX_STREAM_CELLS<<" values\n"; return 2;
  }
  uint64_t seed = cfg.seed ? *cfg.seed : Pcg32().state();
  auto block = generate_streams(seed, cfg.stream, nstreams, cfg.count);
  for (std::size_t k=0;k<nstreams;++k){
    std::cout << stream_for_index(cfg.stream, k) << ":";
    for (std::size_t i=0;i<cfg.count;++i) std::cout << " " << block[k*cfg.count+i];
    std::cout << "\n";
  }
  return 0;
}

static int cmd_check(int argc, char** argv){
  std::map<std::string,std::string> flags;
  std::size_t draws=1000000; double tol=0.02;
  for (int i=2;i<argc;++i){
    std::string a=argv[i]; auto nx=[&](const char* n){ if(i+1>=argc){std::cerr<<"Missing "<<n<<"\n"; return std::string(); } return std::string(argv[++i]); };
    if (a=="--seed") flags["seed"]=nx("seed");
    else if (a=="--stream") flags["stream"]=nx("stream");
    else if (a=="--max") flags["max"]=nx("max");
    else if (a=="--draws") flags["draws"]=nx("draws");
    else if (a=="--tolerance") flags["tolerance"]=nx("tolerance");
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; return 2; }
  }
  if (auto it=flags.find("draws"); it!=flags.end()){
    uint64_t n;
    if (!parse_u64(it->second, n)){ std::cerr<<"Invalid draws: "<<it->second<<"\n"; return 2; }
    draws = (std::size_t)n; flags.erase(it);
  }
  if (auto it=flags.find("tolerance"); it!=flags.end()){
    try { tol = std::stod(it->second); } catch(const std::exception&){ std::cerr<<"Invalid tolerance: "<<it->second<<"\n"; return 2; }
    flags.erase(it);
  }
  DrawConfig cfg; cfg.max = 6; std::string err;
  if (!apply_config(flags, cfg, err)){ std::cerr<<err<<"\n"; return 2; }
  if (cfg.max <= 0){ std::cerr<<"--max must be positive\n"; return 2; }
  if (draws == 0){ std::cerr<<"--draws must be positive\n"; return 2; }
  Pcg32 g = cfg.seed ? Pcg32(*cfg.seed, cfg.stream) : Pcg32::from_clock(cfg.stream);
  auto counts = histogram_below(g, (uint32_t)cfg.max, draws);
  std::cout << std::fixed << std::setprecision(6);
  for (std::size_t v=0; v<counts.size(); ++v) std::cout << v << " " << (double)counts[v]/(double)draws << "\n";
  double dev = max_relative_deviation(counts);
  std::cout << "chi2 " << chi_squared_uniform(counts) << " dof " << counts.size()-1 << "\n";
  std::cout << "max_rel_dev " << dev << "\n";
  return dev <= tol ? 0 : 5;
}

int main(int argc, char** argv) {
  if (argc < 2){ usage(); return 2; }
  std::string first = argv[1];
  if (first=="draw") return cmd_draw(argc, argv);
  if (first=="streams") return cmd_streams(argc, argv);
  if (first=="check") return cmd_check(argc, argv);
  if (first=="version"){ std::cout << pcgr_version() << "\n"; return 0; }
  if (first=="--help" || first=="-h"){ usage(); return 0; }
  std::cerr<<"Unknown command: "<<first<<"\n";
  usage();
  return 2;
}

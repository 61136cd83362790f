#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <random>
#include <fstream>
#include <iostream>

// Writes a rows x cols grid of low-contrast samples: integers clustered in
// [96, 160) or floats clustered around 0.4, so equalization has work to do.
int main(int argc, char** argv){
  if (argc < 5){
    std::cerr << "usage: gen_synth_grid <out.csv> <rows> <cols> <int|float> [seed]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t cols = std::strtoull(argv[3], nullptr, 10);
  const std::string kind = argv[4];
  const std::uint64_t seed = argc > 5 ? std::strtoull(argv[5], nullptr, 10) : 42;
  if (rows == 0 || cols == 0 || (kind != "int" && kind != "float")){
    std::cerr << "rows and cols must be > 0, kind must be int or float\n";
    return 2;
  }

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  std::mt19937_64 rng(seed);
  std::normal_distribution<double> dn(0.0, 1.0);
  for (std::uint64_t r=0;r<rows;++r){
    for (std::uint64_t c=0;c<cols;++c){
      if (c) f << ",";
      if (kind == "int") {
        long v = 128 + std::lround(dn(rng) * 10.0);
        if (v < 96) v = 96;
        if (v > 159) v = 159;
        f << v;
      } else {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.6f", 0.4 + dn(rng) * 0.05);
        f << buf;
      }
    }
    f << "\n";
  }
  std::cerr << "wrote " << rows << "x" << cols << " " << kind << " grid to " << out << "\n";
  return 0;
}

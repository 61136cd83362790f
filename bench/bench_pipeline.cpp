#include "core/cumulative.hpp"
#include "core/equalize.hpp"
#include "core/histogram.hpp"
#include "metrics/timers.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace histeq;

template <class T, class Dist>
static sample_array random_array(std::size_t n, Dist dist, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::vector<T> v(n);
  for (auto& x : v) x = static_cast<T>(dist(rng));
  return sample_array(std::move(v));
}

// Best of `reps` runs, in milliseconds.
static double time_best(int reps, const std::function<void()>& fn) {
  double best = 0.0;
  for (int r = 0; r < reps; ++r) {
    WallTimer wt; wt.start();
    fn();
    wt.stop();
    if (r == 0 || wt.ms() < best) best = wt.ms();
  }
  return best;
}

static void bench_case(const char* name, const sample_array& a, int reps) {
  const double n = static_cast<double>(a.size());
  auto report = [&](const char* op, double ms) {
    const double eps = ms > 0 ? n / (ms / 1000.0) : 0.0;
    fmt::print("bench,case={},op={},elements={},ms={:.3f},Melem/s={:.2f}\n",
               name, op, a.size(), ms, eps / 1e6);
  };
  report("histogram", time_best(reps, [&] { (void)make_histogram(a); }));
  report("cdf",       time_best(reps, [&] { (void)cumulative_distribution(a); }));
  report("equalize",  time_best(reps, [&] { (void)equalize_hist(a); }));
}

int main(int argc, char** argv){
  // Defaults
  std::size_t elements = std::size_t{1} << 22;  // 4 Mi
  int reps = 5;

  // Supported:
  //   --elements <N> | --elements=<N>
  //   --reps <N>     | --reps=<N>
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    if (a.rfind("--elements=",0)==0) {
      elements = static_cast<std::size_t>(std::stoull(std::string(a.substr(11))));
    } else if (a == "--elements" && i+1<argc) {
      elements = static_cast<std::size_t>(std::stoull(argv[++i]));
    } else if (a.rfind("--reps=",0)==0) {
      reps = std::stoi(std::string(a.substr(7)));
    } else if (a == "--reps" && i+1<argc) {
      reps = std::stoi(argv[++i]);
    } else {
      fmt::print(stderr,
        "usage:\n"
        "  histeq_bench [--elements N] [--reps N]\n");
      return 2;
    }
  }
  if (elements == 0 || reps <= 0){
    fmt::print(stderr, "elements and reps must be > 0\n");
    return 2;
  }

  bench_case("uint8",   random_array<std::uint8_t>(elements, std::uniform_int_distribution<int>(0, 255), 1), reps);
  bench_case("uint16",  random_array<std::uint16_t>(elements, std::uniform_int_distribution<int>(0, 65535), 2), reps);
  bench_case("int16",   random_array<std::int16_t>(elements, std::normal_distribution<double>(0.0, 2000.0), 3), reps);
  bench_case("float32", random_array<float>(elements, std::uniform_real_distribution<double>(0.0, 1.0), 4), reps);
  return 0;
}

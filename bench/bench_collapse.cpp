#include "collapse/backend_adapter.hpp"
#include "collapse/collapser.hpp"
#include "metrics/timers.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// Synthetic backend output: `n` contiguous 10-wide buckets with a skewed
// (log-normal-ish) count profile, open at both ends like a range aggregation.
static std::vector<prc::native_range_bucket> synth_buckets(std::size_t n, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::lognormal_distribution<double> dist(2.0, 1.0);
  std::vector<prc::native_range_bucket> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (i > 0)     out[i].from = 10.0 * static_cast<double>(i);
    if (i + 1 < n) out[i].to   = 10.0 * static_cast<double>(i + 1);
    // roughly one bucket in five is empty
    out[i].doc_count = (rng() % 5 == 0) ? 0 : static_cast<std::int64_t>(std::llround(dist(rng)));
  }
  return out;
}

int main(int argc, char** argv){
  std::size_t buckets = 40;
  int target = 3;
  int iterations = 20000;

  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    auto next_int = [&](std::string_view name)->long long{
      if (i+1<argc) return std::stoll(argv[++i]);
      fmt::print(stderr, "missing value for {}\n", name);
      std::exit(2);
    };
    if (a == "--buckets")         buckets = static_cast<std::size_t>(next_int(a));
    else if (a == "--target")     target = static_cast<int>(next_int(a));
    else if (a == "--iterations") iterations = static_cast<int>(next_int(a));
    else {
      fmt::print(stderr,
        "usage:\n"
        "  prc_bench_collapse [--buckets N] [--target N] [--iterations N]\n");
      return 2;
    }
  }
  if (buckets < 1 || target < 1 || iterations < 1){
    fmt::print(stderr, "all values must be >= 1\n");
    return 2;
  }

  const auto input = synth_buckets(buckets, 42);

  prc::WallTimer wt; wt.start();
  std::size_t out_size = 0;
  try {
    for (int it=0; it<iterations; ++it){
      out_size += prc::collapse_native(input, target).size();
    }
  } catch (const prc::empty_distribution& e) {
    fmt::print(stderr, "synthetic input is empty: {}\n", e.what());
    return 2;
  }
  wt.stop();

  const double secs = wt.ms()/1000.0;
  const double per_call_us = iterations>0 ? (wt.ms()*1000.0/iterations) : 0.0;

  fmt::print("bench_collapse,buckets={},target={},iterations={},sec={:.3f},us/call={:.2f},out={}\n",
             buckets, target, iterations, secs, per_call_us, out_size/static_cast<std::size_t>(iterations));
  return 0;
}

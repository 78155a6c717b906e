#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <string>
#include <vector>
#include <random>
#include <fstream>
#include <iostream>

// Writes a product table (id,name,price,category) with log-normal prices,
// the shape prc --prices expects.
int main(int argc, char** argv){
  if (argc < 3){
    std::cerr << "usage: gen_synth_prices <out.csv> <rows> [seed]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t seed = argc > 3 ? std::strtoull(argv[3], nullptr, 10) : 42;

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  f << "id,name,price,category\n";

  std::mt19937_64 rng(seed);
  std::lognormal_distribution<double> price(4.0, 0.9);   // median ~55
  const char* categories[] = {"Luggage","Luggage","Luggage","Outdoor","Books"};
  const char* nouns[] = {"Backpack","Rucksack","Travel Pack","Trolley","Duffel","Tote"};
  for (std::uint64_t i=1;i<=rows;++i){
    const long long cents = std::llround(price(rng) * 100.0);
    const char* noun = nouns[rng() % 6];
    const char* cat  = categories[rng() % 5];
    char pbuf[32];
    std::snprintf(pbuf, sizeof(pbuf), "%lld.%02lld", cents / 100, cents % 100);
    // every 50th row has no price
    f << i << ",\"Item " << i << " " << noun << "\"," << ((i % 50 == 0) ? "" : pbuf) << "," << cat << "\n";
  }
  std::cerr << "wrote " << rows << " rows to " << out << "\n";
  return 0;
}

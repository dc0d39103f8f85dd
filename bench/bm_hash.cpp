#include <cstdint>
#include <string>

#include "benchmark.hpp"
#include "benchmark/benchmark.h"
#include "data.hpp"
#include "hash.hpp"

using sketches::bench::GetData;

template <typename HashFn, typename T>
void BM_Hash(benchmark::State& state) {
  const auto& data = GetData<T>();
  HashFn hash_fn;
  for (auto _ : state) {
    for (const auto& value : data) {
      ::benchmark::DoNotOptimize(hash_fn(value));
    }
    ::benchmark::ClobberMemory();
  }
  ReportThroughput(state, data);
}

#define BENCHMARK_HASH_ALL_TYPES(hashfn)        \
  BENCHMARK_TEMPLATE(BM_Hash, hashfn, int32_t); \
  BENCHMARK_TEMPLATE(BM_Hash, hashfn, int64_t); \
  BENCHMARK_TEMPLATE(BM_Hash, hashfn, double);  \
  BENCHMARK_TEMPLATE(BM_Hash, hashfn, std::string)

/// Full 128 bit MurmurHash3 under the default seed.
struct HashFn {
  template <typename T>
  auto operator()(const T& v) const {
    return sketches::detail::Hash(v);
  }
};
BENCHMARK_HASH_ALL_TYPES(HashFn);

/// 64 bit hash under a derived seed, as used by the per-row hash families.
struct SeededHashFn {
  template <typename T>
  auto operator()(const T& v) const {
    return sketches::SeededHash(v, sketches::DeriveSeed(1, sketches::kSeed));
  }
};
BENCHMARK_HASH_ALL_TYPES(SeededHashFn);

CUSTOM_BENCHMARK_MAIN(true);

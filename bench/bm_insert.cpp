#include <cstdint>
#include <string>

#include "benchmark.hpp"
#include "benchmark/benchmark.h"
#include "bloom/bloom_filter.hpp"
#include "cms/minmax_sketch.hpp"
#include "cs/count_sketch.hpp"
#include "cuckoo/cuckoo_filter.hpp"
#include "data.hpp"
#include "hll/hyperloglog.hpp"
#include "kll/kll_sketch.hpp"
#include "minhash/minhash.hpp"
#include "reservoir/reservoir_sampling.hpp"
#include "ss/space_saving.hpp"
#include "tdigest/tdigest.hpp"

using sketches::bench::GetData;
using sketches::bench::kNumValues;

/// Default-constructible sketch configurations, sized for the benchmark stream.
template <typename T>
struct Bloom : sketches::BloomFilter<T> {
  Bloom()
      : sketches::BloomFilter<T>(
            sketches::BloomFilter<T>::ForFalsePositiveRate(kNumValues, 0.01)) {}
};

template <typename T>
struct Cuckoo : sketches::CuckooFilter<T> {
  Cuckoo()
      : sketches::CuckooFilter<T>(
            sketches::CuckooFilter<T>::ForFalsePositiveRate(kNumValues, 0.01)) {}
};

template <typename T>
struct HLL : sketches::HyperLogLog<T> {
  HLL() : sketches::HyperLogLog<T>(12) {}
};

template <typename T>
struct CS : sketches::CountSketch<T> {
  CS() : sketches::CountSketch<T>(1024, 5) {}
};

template <typename T>
struct MinMax : sketches::MinMaxSketch<T> {
  MinMax() : sketches::MinMaxSketch<T>(1024, 5) {}
};

template <typename T>
struct SS : sketches::SpaceSaving<T> {
  SS() : sketches::SpaceSaving<T>(64) {}
};

template <typename T>
struct KLL : sketches::KllSketch<T> {
  KLL() : sketches::KllSketch<T>(sketches::kll_constants::kDefaultK) {}
};

template <typename T>
struct TDigest : sketches::TDigest {
  TDigest() : sketches::TDigest(100) {}
};

template <typename T>
struct MinHash : sketches::MinHash<T> {
  MinHash() : sketches::MinHash<T>(64) {}
};

template <typename T>
struct Reservoir : sketches::ReservoirSampling<T> {
  Reservoir() : sketches::ReservoirSampling<T>(1024) {}
};

/// Feeds one value through the sketch's unit update.
template <typename Sketch, typename T>
void Update(Sketch& sketch, const T& value) {
  if constexpr (requires { sketch.Insert(value); }) {
    sketch.Insert(value);
  } else if constexpr (requires { sketch.Increment(value); }) {
    sketch.Increment(value);
  } else {
    sketch.Add(value);
  }
}

template <typename Sketch, typename T>
void BM_Insert(benchmark::State& state) {
  const auto& data = GetData<T>();
  for (auto _ : state) {
    Sketch sketch;
    for (const auto& value : data) {
      Update(sketch, value);
    }
    ::benchmark::DoNotOptimize(sketch);
    ::benchmark::ClobberMemory();
  }
  ReportThroughput(state, data);
}

#define BENCHMARK_INSERT_TYPE(sketch, type) \
  BENCHMARK_TEMPLATE(BM_Insert, sketch<type>, type)

#define BENCHMARK_INSERT_ALL_TYPES(sketch) \
  BENCHMARK_INSERT_TYPE(sketch, int32_t);  \
  BENCHMARK_INSERT_TYPE(sketch, int64_t);  \
  BENCHMARK_INSERT_TYPE(sketch, double);   \
  BENCHMARK_INSERT_TYPE(sketch, std::string)

BENCHMARK_INSERT_ALL_TYPES(Bloom);
BENCHMARK_INSERT_ALL_TYPES(Cuckoo);
BENCHMARK_INSERT_ALL_TYPES(HLL);
BENCHMARK_INSERT_ALL_TYPES(CS);
BENCHMARK_INSERT_ALL_TYPES(MinMax);
BENCHMARK_INSERT_ALL_TYPES(SS);
BENCHMARK_INSERT_ALL_TYPES(KLL);
BENCHMARK_INSERT_ALL_TYPES(MinHash);
BENCHMARK_INSERT_ALL_TYPES(Reservoir);

BENCHMARK_INSERT_TYPE(TDigest, double);

CUSTOM_BENCHMARK_MAIN(true);

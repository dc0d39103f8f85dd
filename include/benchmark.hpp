#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "benchmark/benchmark.h"
#include "data.hpp"

inline auto AmendArgs(int argc, char* argv[]) {
  std::vector<char*> new_argv(argv, argv + argc);
  new_argv.push_back(const_cast<char*>("--benchmark_counters_tabular=true"));
  new_argv.push_back(const_cast<char*>("--benchmark_out_format=json"));
  return new_argv;
}

/// Records throughput counters for a benchmark that streamed data once per
/// iteration.
template <typename T>
void ReportThroughput(benchmark::State& state, const std::vector<T>& data) {
  const int64_t num_items =
      static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(data.size());
  const int64_t item_size = sketches::bench::ItemSize(data);
  state.SetItemsProcessed(num_items);
  state.SetBytesProcessed(num_items * item_size);
  state.counters["item_size"] = static_cast<double>(item_size);
}

/// Generates the streams up front so that data generation is not timed.
#define CUSTOM_BENCHMARK_MAIN(cache_data)                               \
  int main(int argc, char** argv) {                                     \
    if (cache_data) {                                                   \
      ::sketches::bench::GetData<int32_t>();                            \
      ::sketches::bench::GetData<int64_t>();                            \
      ::sketches::bench::GetData<double>();                             \
      ::sketches::bench::GetData<std::string>();                        \
    }                                                                   \
                                                                        \
    auto new_argv = AmendArgs(argc, argv);                              \
    argc = static_cast<int>(new_argv.size());                           \
    ::benchmark::Initialize(&argc, new_argv.data());                    \
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1; \
    ::benchmark::RunSpecifiedBenchmarks();                              \
    ::benchmark::Shutdown();                                            \
    return 0;                                                           \
  }

#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "random_utils.hpp"
#include "types.hpp"

namespace sketches::bench {

/// Number of values in every generated stream.
inline constexpr size_t kNumValues = 1'000'000;

/// Fixed-width decimal rendering, so all generated strings have equal length.
inline std::string to_string(int64_t value) {
  constexpr int kWidth = 20;  // -9223372036854775808 to 9223372036854775807
  std::stringstream ss;
  if (value < 0) {
    ss << '-' << std::setfill('0') << std::setw(kWidth - 1) << -value;
  } else {
    ss << std::setfill('0') << std::setw(kWidth) << value;
  }
  return std::move(ss).str();
}

/// Uniformly distributed stream of kNumValues values, generated once per type.
/// Strings are the decimal rendering of random int64 values.
template <typename T>
const std::vector<T>& GetData() {
  static std::vector<T> data;
  if (data.empty()) {
    using TT = std::conditional_t<detail::is_string_v<T>, int64_t, T>;
    using distribution = std::conditional_t<std::is_integral_v<TT>,
                                            std::uniform_int_distribution<TT>,
                                            std::uniform_real_distribution<TT>>;
    constexpr uint64_t kDataSeed = 42;
    auto gen = random_utils::MakeEngine(kDataSeed);
    distribution dist(std::numeric_limits<TT>::lowest() / 2,
                      std::numeric_limits<TT>::max() / 2);
    data.reserve(kNumValues);
    for (size_t i = 0; i < kNumValues; ++i) {
      if constexpr (detail::is_string_v<T>) {
        data.emplace_back(to_string(dist(gen)));
      } else {
        data.emplace_back(dist(gen));
      }
    }
  }
  return data;
}

/// Bytes of one stream value, as reported to the benchmark counters.
template <typename T>
int64_t ItemSize(const std::vector<T>& data) {
  if constexpr (detail::is_string_v<T>) {
    return static_cast<int64_t>(data[0].size() * sizeof(char));
  } else {
    return sizeof(T);
  }
}

}  // namespace sketches::bench

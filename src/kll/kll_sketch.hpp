// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

// This implementation borrows from the Apache DataSketches v4.1.0
// implementation of the sketch. We made the following significant changes:
// - Levels are stored as separate growable vectors instead of one shared
//    buffer, which makes merging a plain concatenation.
// - A level is compacted as soon as it exceeds ceil(k * 0.75^level), with a
//    lower bound of two. An odd element is held back at its level.
// - Quantiles are answered from a weighted flattening of all levels instead of
//    a cached sorted view.
// - Non-finite floating point values are ignored instead of only NaN.
// - The randomness source is a single pcg32_fast bit stream owned by the
//    sketch, so copies of a sketch replay the same compactions.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "dimensions.hpp"
#include "error.hpp"
#include "random_utils.hpp"
#include "saturating.hpp"

namespace sketches {

/// KLL sketch constants
namespace kll_constants {
/// default value of parameter K
inline constexpr size_t kDefaultK = 200;
/// min value of parameter K
inline constexpr size_t kMinK = 2;
/// capacity decay between two adjacent levels
inline constexpr double kLevelDecay = 0.75;
/// smallest capacity of any level
inline constexpr size_t kMinLevelCapacity = 2;
inline constexpr uint64_t kRandomSeed = 0xD1B54A32C192ED03ULL;
}  // namespace kll_constants

/// Quantile sketch by Karnin, Lang and Liberty.
///
/// Karnin, Zohar, Kevin Lang, and Edo Liberty. "Optimal quantile approximation
/// in streams." 2016 IEEE 57th Annual Symposium on Foundations of Computer
/// Science (FOCS). IEEE, 2016.
///
/// Level 0 receives raw values, an item on level l implicitly carries weight
/// 2^l.
///
/// @tparam T the value type.
/// @tparam C the strict weak ordering of values.
template <typename T = double, typename C = std::less<T>>
class KllSketch {
 public:
  using value_type = T;
  using comparator = C;

  explicit KllSketch(size_t k = kll_constants::kDefaultK,
                     const C& comparator = C())
      : comparator_(comparator),
        k_(k),
        levels_(1),
        level_capacities_{level_capacity(k, 0)},
        random_bit_(random_utils::MakeRandomBit(kll_constants::kRandomSeed)) {
    if (k < kll_constants::kMinK) {
      throw InvalidParameter("k must be >= " +
                             std::to_string(kll_constants::kMinK) + ": " +
                             std::to_string(k));
    }
  }

  /// Creates a sketch with k = ceil(2 / rank_error).
  static KllSketch ForRankError(double rank_error) {
    detail::check_open_unit(rank_error, "rank_error");
    const size_t k = detail::to_dimension(std::ceil(2.0 / rank_error), "k");
    return KllSketch(std::max(k, kll_constants::kMinK));
  }

  /// Insert a value into the sketch. Non-finite values are ignored.
  void Add(const T& x) {
    if (!check_update_item(x)) return;
    levels_[0].push_back(x);
    n_ = SaturatingAdd(n_, uint64_t{1});
    compact_all_levels();
  }

  /// Approximate value at normalized rank q in [0, 1].
  T Quantile(double q) const {
    if (!(q >= 0.0 && q <= 1.0)) {
      throw InvalidParameter("q must be finite and in [0, 1]");
    }
    if (is_empty()) {
      throw InvalidParameter("quantile is undefined for an empty sketch");
    }

    std::vector<std::pair<T, uint64_t>> weighted;
    weighted.reserve(num_retained());
    __uint128_t total_weight = 0;
    for (size_t level = 0; level < levels_.size(); ++level) {
      const uint64_t weight = level < 64 ? uint64_t{1} << level : UINT64_MAX;
      for (const auto& value : levels_[level]) {
        weighted.emplace_back(value, weight);
        total_weight += weight;
      }
    }
    std::sort(weighted.begin(), weighted.end(),
              [this](const auto& a, const auto& b) {
                return comparator_(a.first, b.first);
              });

    const auto target = static_cast<__uint128_t>(
        std::round(static_cast<double>(total_weight - 1) * q));
    __uint128_t cumulative = 0;
    for (const auto& [value, weight] : weighted) {
      cumulative += weight;
      if (cumulative > target) return value;
    }
    // target <= total_weight - 1 < cumulative after the last item
    return weighted.back().first;
  }

  /// Merges another sketch of the same k into this one.
  void Merge(const KllSketch& other) {
    if (k_ != other.k_) {
      throw IncompatibleSketches("k must match for merge: " +
                                 std::to_string(k_) + " vs " +
                                 std::to_string(other.k_));
    }
    if (this == &other) {
      const KllSketch copy(other);
      Merge(copy);
      return;
    }
    while (levels_.size() < other.levels_.size()) add_level();
    for (size_t level = 0; level < other.levels_.size(); ++level) {
      levels_[level].insert(levels_[level].end(), other.levels_[level].begin(),
                            other.levels_[level].end());
    }
    n_ = SaturatingAdd(n_, other.n_);
    compact_all_levels();
  }

  void Clear() {
    levels_.assign(1, {});
    level_capacities_.assign(1, level_capacity(k_, 0));
    n_ = 0;
  }

  size_t k() const { return k_; }
  /// Number of values added, saturating.
  uint64_t count() const { return n_; }
  size_t num_levels() const { return levels_.size(); }
  bool is_empty() const { return n_ == 0; }

  /// Number of values currently stored across all levels.
  size_t num_retained() const {
    size_t retained = 0;
    for (const auto& level : levels_) retained += level.size();
    return retained;
  }

 private:
  C comparator_;
  size_t k_;
  uint64_t n_ = 0;
  std::vector<std::vector<T>> levels_;
  /// Cached ceil(k * 0.75^level) per allocated level.
  std::vector<size_t> level_capacities_;
  random_utils::RandomBit random_bit_;

  static size_t level_capacity(size_t k, size_t level) {
    const double capacity =
        std::ceil(static_cast<double>(k) *
                  std::pow(kll_constants::kLevelDecay, static_cast<double>(level)));
    return std::max(kll_constants::kMinLevelCapacity,
                    static_cast<size_t>(capacity));
  }

  template <typename TT = T,
            typename std::enable_if<std::is_floating_point<TT>::value,
                                    int>::type = 0>
  static inline bool check_update_item(TT item) {
    return std::isfinite(item);
  }

  template <typename TT = T,
            typename std::enable_if<!std::is_floating_point<TT>::value,
                                    int>::type = 0>
  static inline bool check_update_item(const TT&) {
    return true;
  }

  void add_level() {
    level_capacities_.push_back(level_capacity(k_, levels_.size()));
    levels_.emplace_back();
  }

  /// Walks levels bottom up. Compacting the top level appends a new one, which
  /// the loop visits as well.
  void compact_all_levels() {
    for (size_t level = 0; level < levels_.size(); ++level) {
      if (levels_[level].size() > level_capacities_[level]) {
        compact_level(level);
      }
    }
  }

  /// Sorts a level and promotes every other value to the next level, starting
  /// at a random offset. The largest value stays behind if the level is odd.
  void compact_level(size_t level) {
    if (level + 1 == levels_.size()) add_level();

    std::vector<T> values;
    values.swap(levels_[level]);
    std::sort(values.begin(), values.end(), comparator_);

    const bool odd = (values.size() & 1) != 0;
    const size_t end = odd ? values.size() - 1 : values.size();
    auto& above = levels_[level + 1];
    for (size_t i = random_bit_(); i < end; i += 2) {
      above.push_back(std::move(values[i]));
    }
    if (odd) levels_[level].push_back(std::move(values.back()));
  }
};

}  // namespace sketches

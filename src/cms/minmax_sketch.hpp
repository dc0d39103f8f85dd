#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <numbers>
#include <utility>
#include <vector>

#include "dimensions.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "saturating.hpp"

namespace sketches {

namespace cms_constants {
const uint64_t kSeedBase = 0xA0761D6478BD642FULL;
}  // namespace cms_constants

/// Count-Min sketch with conservative update, reporting both the minimum and
/// the maximum counter of an item.
///
/// The sketch was introduced in the paper
///   Cormode, Graham, and Shan Muthukrishnan. "An improved data stream
///   summary: the count-min sketch and its applications." Journal of
///   Algorithms 55.1 (2005): 58-75.
/// Conservative update only raises each counter to the new lower bound of the
/// item instead of adding to all of them, which never underestimates and
/// overestimates less.
///
/// @tparam T the data type the sketch summarizes.
template <typename T>
class MinMaxSketch {
 public:
  MinMaxSketch(size_t width, size_t depth)
      : width_(width),
        depth_(depth),
        C(detail::table_size(width, depth), 0),
        cells_(depth) {
    seeds_.reserve(depth);
    for (size_t j = 0; j < depth; ++j) {
      seeds_.push_back(DeriveSeed(j, cms_constants::kSeedBase));
    }
  }

  /// Sketch with additive error epsilon * N with probability at least
  /// 1 - delta: width = ceil(e / epsilon), depth = ceil(ln(1 / delta)).
  static MinMaxSketch ForErrorBounds(double epsilon, double delta) {
    detail::check_open_unit(epsilon, "epsilon");
    const size_t depth = detail::depth_for_delta(delta);
    const size_t width =
        detail::to_dimension(std::ceil(std::numbers::e / epsilon), "width");
    return MinMaxSketch(width, depth);
  }

  /// Adds count occurrences of value using conservative update.
  void Add(const T& value, uint64_t count) {
    if (count == 0) return;

    uint64_t min_counter = std::numeric_limits<uint64_t>::max();
    for (size_t j = 0; j < depth_; ++j) {
      cells_[j] = CellIndex(value, j);
      min_counter = std::min(min_counter, C[cells_[j]]);
    }

    const uint64_t target = SaturatingAdd(min_counter, count);
    for (const size_t cell : cells_) {
      C[cell] = std::max(C[cell], target);
    }
    total_count_ = SaturatingAdd(total_count_, count);
  }

  void Increment(const T& value) { Add(value, 1); }

  /// Minimum counter over the rows. Never below the true count.
  uint64_t Estimate(const T& value) const noexcept {
    uint64_t result = std::numeric_limits<uint64_t>::max();
    for (size_t j = 0; j < depth_; ++j) {
      result = std::min(result, C[CellIndex(value, j)]);
    }
    return result;
  }

  /// Maximum counter over the rows, a looser upper estimate.
  uint64_t MaxEstimate(const T& value) const noexcept {
    uint64_t result = 0;
    for (size_t j = 0; j < depth_; ++j) {
      result = std::max(result, C[CellIndex(value, j)]);
    }
    return result;
  }

  /// (Estimate, MaxEstimate) of value.
  std::pair<uint64_t, uint64_t> EstimateInterval(const T& value) const noexcept {
    return {Estimate(value), MaxEstimate(value)};
  }

  /// Element-wise saturating sum of the counters of a sketch with the same
  /// dimensions and hash functions.
  void Merge(const MinMaxSketch& other) {
    if (width_ != other.width_ || depth_ != other.depth_) {
      throw IncompatibleSketches("width and depth must match for merge");
    }
    if (seeds_ != other.seeds_) {
      throw IncompatibleSketches("hash seeds must match for merge");
    }
    for (size_t i = 0; i < C.size(); ++i) {
      C[i] = SaturatingAdd(C[i], other.C[i]);
    }
    total_count_ = SaturatingAdd(total_count_, other.total_count_);
  }

  void Clear() noexcept {
    std::fill(C.begin(), C.end(), 0);
    total_count_ = 0;
  }

  size_t width() const noexcept { return width_; }
  size_t depth() const noexcept { return depth_; }
  uint64_t total_count() const noexcept { return total_count_; }
  bool is_empty() const noexcept { return total_count_ == 0; }

 private:
  size_t width_;
  size_t depth_;
  /// Counters of the sketch, row-major.
  std::vector<uint64_t> C;
  std::vector<uint64_t> seeds_;
  /// Cell of each row for the item being added.
  std::vector<size_t> cells_;
  uint64_t total_count_ = 0;

  size_t CellIndex(const T& value, size_t j) const noexcept {
    return j * width_ + SeededHash(value, seeds_[j]) % width_;
  }
};

}  // namespace sketches

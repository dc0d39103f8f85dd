#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "compiler.hpp"
#include "dimensions.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "saturating.hpp"

namespace sketches {

namespace cs_constants {
const uint64_t kIndexSeedBase = 0x0D6E8FD93A5E4C31ULL;
const uint64_t kSignSeedBase = 0xA0761D6478BD642FULL;
/// rows whose estimates fit on the stack during a point query
const size_t kInlineDepth = 64;
}  // namespace cs_constants

/// Count Sketch for unbiased signed frequency estimation.
///
/// The implementation follows the book
///   Cormode, Graham, and Ke Yi. Small summaries for big data. Cambridge
///   University Press, 2020.
///
/// The sketch was introduced in the paper
///   Charikar, Moses, Kevin Chen, and Martin Farach-Colton. "Finding frequent
///   items in data streams." International Colloquium on Automata, Languages,
///   and Programming. Berlin, Heidelberg: Springer Berlin Heidelberg, 2002.
///
/// Every row j owns a bucket hash h_j and a sign hash g_j. Updates add
/// g_j(x) * delta to C[j][h_j(x)], and a point query is the median of
/// g_j(x) * C[j][h_j(x)] over the rows, so increments and decrements cancel.
///
/// @tparam T the data type the sketch summarizes.
template <typename T>
class CountSketch {
 public:
  CountSketch(size_t width, size_t depth)
      : width_(width),
        depth_(depth),
        C(detail::table_size(width, depth), 0) {
    index_seeds_.reserve(depth);
    sign_seeds_.reserve(depth);
    for (size_t j = 0; j < depth; ++j) {
      index_seeds_.push_back(DeriveSeed(j, cs_constants::kIndexSeedBase));
      sign_seeds_.push_back(DeriveSeed(j, cs_constants::kSignSeedBase));
    }
  }

  /// Sketch with additive error epsilon * ||f||_2 with probability at least
  /// 1 - delta: width = ceil(3 / epsilon^2), depth = ceil(ln(1 / delta)).
  static CountSketch ForErrorBounds(double epsilon, double delta) {
    detail::check_open_unit(epsilon, "epsilon");
    const size_t depth = detail::depth_for_delta(delta);
    const size_t width =
        detail::to_dimension(std::ceil(3.0 / (epsilon * epsilon)), "width");
    return CountSketch(width, depth);
  }

  /// Adds delta, which may be negative, to the count of value.
  void Add(const T& value, int64_t delta) noexcept {
    if (delta == 0) return;
    for (size_t j = 0; j < depth_; ++j) {
      const auto [h, sign] = HashExtract(value, j);
      int64_t& counter = GetCounter(j, h);
      counter = SaturatingAdd(counter, sign > 0 ? delta : SaturatingNeg(delta));
    }
    const uint64_t magnitude =
        delta < 0 ? uint64_t{0} - static_cast<uint64_t>(delta)
                  : static_cast<uint64_t>(delta);
    total_update_magnitude_ = SaturatingAdd(total_update_magnitude_, magnitude);
  }

  void Increment(const T& value) noexcept { Add(value, 1); }
  void Decrement(const T& value) noexcept { Add(value, -1); }

  /// Median over the rows of the sign-corrected counters.
  int64_t Estimate(const T& value) const {
    std::array<int64_t, cs_constants::kInlineDepth> inline_estimates;
    std::vector<int64_t> heap_estimates;
    int64_t* estimates = inline_estimates.data();
    if (SKETCHES_UNLIKELY(depth_ > cs_constants::kInlineDepth)) {
      heap_estimates.resize(depth_);
      estimates = heap_estimates.data();
    }
    for (size_t j = 0; j < depth_; ++j) {
      const auto [h, sign] = HashExtract(value, j);
      const int64_t counter = GetCounter(j, h);
      estimates[j] = sign > 0 ? counter : SaturatingNeg(counter);
    }

    const size_t mid = depth_ / 2;
    std::nth_element(estimates, estimates + mid, estimates + depth_);
    const int64_t upper = estimates[mid];
    if (depth_ % 2 == 1) return upper;

    const int64_t lower = *std::max_element(estimates, estimates + mid);
    return static_cast<int64_t>((static_cast<__int128_t>(lower) + upper) / 2);
  }

  /// Element-wise saturating sum of the counters of a sketch with the same
  /// dimensions and hash functions.
  void Merge(const CountSketch& other) {
    if (width_ != other.width_ || depth_ != other.depth_) {
      throw IncompatibleSketches("width and depth must match for merge");
    }
    if (index_seeds_ != other.index_seeds_ ||
        sign_seeds_ != other.sign_seeds_) {
      throw IncompatibleSketches("hash seeds must match for merge");
    }
    for (size_t i = 0; i < C.size(); ++i) {
      C[i] = SaturatingAdd(C[i], other.C[i]);
    }
    total_update_magnitude_ =
        SaturatingAdd(total_update_magnitude_, other.total_update_magnitude_);
  }

  void Clear() noexcept {
    std::fill(C.begin(), C.end(), 0);
    total_update_magnitude_ = 0;
  }

  size_t width() const noexcept { return width_; }
  size_t depth() const noexcept { return depth_; }
  /// Sum of |delta| over all updates.
  uint64_t total_update_magnitude() const noexcept {
    return total_update_magnitude_;
  }
  bool is_empty() const noexcept { return total_update_magnitude_ == 0; }

 private:
  size_t width_;
  size_t depth_;
  /// Counters of the sketch, row-major.
  std::vector<int64_t> C;
  std::vector<uint64_t> index_seeds_;
  std::vector<uint64_t> sign_seeds_;
  uint64_t total_update_magnitude_ = 0;

  /// Counter accessor used to be able to reuse code
  int64_t const& GetCounter(size_t j, size_t h) const { return C[j * width_ + h]; }

  /// From  Effective C++, 3rd ed by Scott Meyers, ISBN-13: 9780321334879
  /// Avoid Duplication in const and Non-const Member Function," p. 23 Item 3
  int64_t& GetCounter(size_t j, size_t h) {
    return const_cast<int64_t&>(std::as_const(*this).GetCounter(j, h));
  }

  /// Bucket h_j(x) and sign g_j(x) in {-1, +1} of row j.
  SKETCHES_OPT_INLINE std::pair<size_t, int64_t> HashExtract(const T& value,
                                                             size_t j) const {
    const size_t h = SeededHash(value, index_seeds_[j]) % width_;
    const int64_t sign = (SeededHash(value, sign_seeds_[j]) & 1) ? -1 : 1;
    return {h, sign};
  }
};

}  // namespace sketches

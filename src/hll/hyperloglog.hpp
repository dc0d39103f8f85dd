#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "error.hpp"
#include "hash.hpp"

namespace sketches {

namespace hll_constants {
const uint8_t kMinPrecision = 4;
const uint8_t kMaxPrecision = 18;
const uint64_t kSeed = 0xD6E8FD935E7A4A6DULL;
}  // namespace hll_constants

/// HyperLogLog sketch for approximate distinct counting.
///
/// The estimator follows the paper
///   Flajolet, Philippe, et al. "Hyperloglog: the analysis of a near-optimal
///   cardinality estimation algorithm." Discrete Mathematics and Theoretical
///   Computer Science, 2007.
/// with linear counting for the small range and a correction for the 64 bit
/// hash space in the large range.
///
/// @tparam T the data type the sketch summarizes.
template <typename T>
class HyperLogLog {
 public:
  /// @param precision p, the sketch keeps 2^p registers. Must be in [4, 18].
  explicit HyperLogLog(uint8_t precision) : precision_(precision) {
    if (precision < hll_constants::kMinPrecision ||
        precision > hll_constants::kMaxPrecision) {
      throw InvalidParameter("precision must be in [4, 18]: " +
                             std::to_string(precision));
    }
    registers_.assign(size_t{1} << precision, 0);
  }

  /// Creates a sketch whose standard error 1.04 / sqrt(2^p) does not exceed
  /// relative_error, within the supported precision range.
  static HyperLogLog ForRelativeError(double relative_error) {
    detail::check_open_unit(relative_error, "relative_error");
    const double registers = std::pow(1.04 / relative_error, 2);
    const double precision =
        std::clamp(std::ceil(std::log2(registers)),
                   static_cast<double>(hll_constants::kMinPrecision),
                   static_cast<double>(hll_constants::kMaxPrecision));
    return HyperLogLog(static_cast<uint8_t>(precision));
  }

  /// Insert a value into the sketch.
  void Add(const T& value) noexcept {
    const uint64_t hash = SeededHash(value, hll_constants::kSeed);
    const size_t index = hash >> (64 - precision_);
    registers_[index] = std::max(registers_[index], Rank(hash));
  }

  /// Estimated number of distinct values added.
  double Estimate() const noexcept {
    if (is_empty()) return 0.0;

    const double m = static_cast<double>(registers_.size());
    double harmonic_sum = 0.0;
    size_t zero_registers = 0;
    for (const uint8_t reg : registers_) {
      harmonic_sum += std::ldexp(1.0, -static_cast<int>(reg));
      zero_registers += reg == 0;
    }

    double estimate = Alpha(registers_.size()) * m * m / harmonic_sum;
    if (estimate <= 2.5 * m && zero_registers > 0) {
      estimate = m * std::log(m / static_cast<double>(zero_registers));
    }

    constexpr double kTwoTo64 = 18446744073709551616.0;
    if (estimate > kTwoTo64 / 30.0) {
      const double ratio = std::min(
          estimate / kTwoTo64, 1.0 - std::numeric_limits<double>::epsilon());
      estimate = -kTwoTo64 * std::log(1.0 - ratio);
    }
    return estimate;
  }

  /// Estimate() rounded to the nearest integer.
  uint64_t Count() const noexcept {
    return static_cast<uint64_t>(std::round(Estimate()));
  }

  /// Register-wise maximum. The result equals the sketch of the union stream.
  void Merge(const HyperLogLog& other) {
    CheckCompatible(other);
    for (size_t i = 0; i < registers_.size(); ++i) {
      registers_[i] = std::max(registers_[i], other.registers_[i]);
    }
  }

  /// Estimated |A u B|.
  double UnionEstimate(const HyperLogLog& other) const {
    HyperLogLog merged(*this);
    merged.Merge(other);
    return merged.Estimate();
  }

  /// Estimated |A n B| by inclusion-exclusion, clamped to
  /// [0, min(|A|, |B|)] since estimator noise can leave that range.
  double IntersectionEstimate(const HyperLogLog& other) const {
    const double union_estimate = UnionEstimate(other);
    const double a = Estimate();
    const double b = other.Estimate();
    return std::clamp(a + b - union_estimate, 0.0, std::min(a, b));
  }

  /// Estimated |A n B| / |A u B| in [0, 1]. Two empty sketches are
  /// identical, so their index is 1.
  double JaccardIndex(const HyperLogLog& other) const {
    const double union_estimate = UnionEstimate(other);
    if (union_estimate == 0.0) return 1.0;
    return std::clamp(IntersectionEstimate(other) / union_estimate, 0.0, 1.0);
  }

  /// 1.04 / sqrt(m).
  double ExpectedRelativeError() const noexcept {
    return 1.04 / std::sqrt(static_cast<double>(registers_.size()));
  }

  void Clear() noexcept { std::fill(registers_.begin(), registers_.end(), 0); }

  uint8_t precision() const noexcept { return precision_; }
  size_t register_count() const noexcept { return registers_.size(); }
  const std::vector<uint8_t>& registers() const noexcept { return registers_; }

  bool is_empty() const noexcept {
    return std::all_of(registers_.begin(), registers_.end(),
                       [](uint8_t reg) { return reg == 0; });
  }

 private:
  uint8_t precision_;
  std::vector<uint8_t> registers_;

  void CheckCompatible(const HyperLogLog& other) const {
    if (precision_ != other.precision_) {
      throw IncompatibleSketches("precision must match: " +
                                 std::to_string(precision_) + " vs " +
                                 std::to_string(other.precision_));
    }
  }

  /// 1-based position of the first set bit after the p index bits, capped
  /// at 64 - p + 1 when the suffix is all zeros.
  uint8_t Rank(uint64_t hash) const noexcept {
    const uint64_t suffix = hash << precision_;
    const int max_rank = 64 - precision_ + 1;
    return static_cast<uint8_t>(std::min(std::countl_zero(suffix) + 1, max_rank));
  }

  static double Alpha(size_t m) noexcept {
    switch (m) {
      case 16:
        return 0.673;
      case 32:
        return 0.697;
      case 64:
        return 0.709;
      default:
        return 0.7213 / (1.0 + 1.079 / static_cast<double>(m));
    }
  }
};

}  // namespace sketches

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <vector>

#include "dimensions.hpp"
#include "error.hpp"
#include "hash.hpp"

namespace sketches {

namespace minhash_constants {
inline constexpr uint64_t kSeedBase = 0xBF58476D1CE4E5B9ULL;
inline constexpr uint64_t kEmptySlot = std::numeric_limits<uint64_t>::max();
}  // namespace minhash_constants

/// MinHash signature for Jaccard similarity estimation.
///
/// Broder, Andrei Z. "On the resemblance and containment of documents."
/// Proceedings. Compression and Complexity of SEQUENCES 1997. IEEE, 1997.
///
/// Position i of the signature holds the minimum hash under the i-th seed of
/// every value added so far.
///
/// @tparam T the data type the sketch summarizes.
template <typename T>
class MinHash {
 public:
  explicit MinHash(size_t num_hashes)
      : seeds_(MakeSeeds(num_hashes)),
        signature_(num_hashes, minhash_constants::kEmptySlot) {
    if (num_hashes == 0) {
      throw InvalidParameter("num_hashes must be greater than zero");
    }
  }

  /// Creates a sketch with num_hashes = ceil(1 / std_error^2).
  static MinHash ForStandardError(double std_error) {
    detail::check_open_unit(std_error, "std_error");
    return MinHash(detail::to_dimension(
        std::ceil(1.0 / (std_error * std_error)), "num_hashes"));
  }

  /// The seed family shared by every sketch with num_hashes positions.
  static std::vector<uint64_t> MakeSeeds(size_t num_hashes) {
    std::vector<uint64_t> seeds(num_hashes);
    for (size_t i = 0; i < num_hashes; ++i) {
      seeds[i] = DeriveSeed(i, minhash_constants::kSeedBase);
    }
    return seeds;
  }

  /// Insert a value into the sketch.
  void Add(const T& value) {
    for (size_t i = 0; i < seeds_.size(); ++i) {
      signature_[i] = std::min(signature_[i], SeededHash(value, seeds_[i]));
    }
    observed_any_ = true;
  }

  /// Fraction of equal signature positions. Two empty sketches are identical,
  /// an empty sketch shares nothing with a non-empty one.
  double EstimateJaccard(const MinHash& other) const {
    CheckCompatible(other);
    if (!observed_any_ || !other.observed_any_) {
      return observed_any_ == other.observed_any_ ? 1.0 : 0.0;
    }
    size_t matches = 0;
    for (size_t i = 0; i < signature_.size(); ++i) {
      matches += signature_[i] == other.signature_[i];
    }
    return static_cast<double>(matches) /
           static_cast<double>(signature_.size());
  }

  double JaccardIndex(const MinHash& other) const {
    return EstimateJaccard(other);
  }

  /// Element-wise minimum, the signature of the union stream.
  void Merge(const MinHash& other) {
    CheckCompatible(other);
    for (size_t i = 0; i < signature_.size(); ++i) {
      signature_[i] = std::min(signature_[i], other.signature_[i]);
    }
    observed_any_ = observed_any_ || other.observed_any_;
  }

  /// 1 / sqrt(num_hashes).
  double ExpectedError() const {
    return 1.0 / std::sqrt(static_cast<double>(num_hashes()));
  }

  void Clear() {
    std::fill(signature_.begin(), signature_.end(),
              minhash_constants::kEmptySlot);
    observed_any_ = false;
  }

  size_t num_hashes() const { return signature_.size(); }
  std::span<const uint64_t> signature() const { return signature_; }
  const std::vector<uint64_t>& seeds() const { return seeds_; }
  bool is_empty() const { return !observed_any_; }

 private:
  std::vector<uint64_t> seeds_;
  std::vector<uint64_t> signature_;
  bool observed_any_ = false;

  void CheckCompatible(const MinHash& other) const {
    if (seeds_ != other.seeds_) {
      throw IncompatibleSketches("num_hashes/hash seeds must match: " +
                                 std::to_string(num_hashes()) + " vs " +
                                 std::to_string(other.num_hashes()));
    }
  }
};

}  // namespace sketches

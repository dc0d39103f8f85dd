#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <utility>
#include <vector>

#include "error.hpp"
#include "hash.hpp"
#include "saturating.hpp"

namespace sketches {

namespace bloom_constants {
const uint64_t kSeedA = 0x243F6A8885A308D3ULL;
const uint64_t kSeedB = 0x13198A2E03707344ULL;
}  // namespace bloom_constants

/// Bloom filter for approximate set membership.
///
/// A Bloom filter may report false positives but never false negatives. The
/// k probe positions are derived by double hashing as described in
///   Kirsch, Adam, and Michael Mitzenmacher. "Less hashing, same performance:
///   Building a better Bloom filter." European Symposium on Algorithms.
///   Berlin, Heidelberg: Springer Berlin Heidelberg, 2006.
///
/// @tparam T the data type the filter summarizes.
template <typename T>
class BloomFilter {
 public:
  /// Creates a filter with explicit bit count and number of probes.
  BloomFilter(size_t num_bits, uint32_t num_hashes)
      : num_bits_(num_bits), num_hashes_(num_hashes) {
    if (num_bits == 0) {
      throw InvalidParameter("num_bits must be greater than zero");
    }
    if (num_hashes == 0) {
      throw InvalidParameter("num_hashes must be greater than zero");
    }
    if (num_bits > kMaxBits) {
      throw InvalidParameter("bit array size overflows");
    }
    words_.assign((num_bits + 63) / 64, 0);
  }

  /// Creates a filter sized for expected_items at the given false-positive
  /// rate.
  static BloomFilter ForFalsePositiveRate(size_t expected_items,
                                          double false_positive_rate) {
    const size_t num_bits = OptimalNumBits(expected_items, false_positive_rate);
    return BloomFilter(num_bits, OptimalNumHashes(num_bits, expected_items));
  }

  /// m = ceil(-n * ln(p) / ln(2)^2), at least 1.
  static size_t OptimalNumBits(size_t expected_items,
                               double false_positive_rate) {
    if (expected_items == 0) {
      throw InvalidParameter("expected_items must be greater than zero");
    }
    detail::check_open_unit(false_positive_rate, "false_positive_rate");
    const double n = static_cast<double>(expected_items);
    const double bits = std::ceil(-n * std::log(false_positive_rate) /
                                  (std::numbers::ln2 * std::numbers::ln2));
    if (!(bits < static_cast<double>(kMaxBits))) {
      throw InvalidParameter("bit array size overflows");
    }
    return std::max<size_t>(1, static_cast<size_t>(bits));
  }

  /// k = round((m / n) * ln(2)), at least 1.
  static uint32_t OptimalNumHashes(size_t num_bits, size_t expected_items) {
    if (num_bits == 0) {
      throw InvalidParameter("num_bits must be greater than zero");
    }
    if (expected_items == 0) {
      throw InvalidParameter("expected_items must be greater than zero");
    }
    const double k = std::round(static_cast<double>(num_bits) /
                                static_cast<double>(expected_items) *
                                std::numbers::ln2);
    return std::max<uint32_t>(1, static_cast<uint32_t>(k));
  }

  /// Insert a value into the filter.
  void Insert(const T& value) noexcept {
    auto [probe, step] = HashPair(value);
    for (uint32_t i = 0; i < num_hashes_; ++i) {
      SetBit(probe % num_bits_);
      probe += step;
    }
    inserted_items_ = SaturatingAdd<uint64_t>(inserted_items_, 1);
  }

  /// @return false if the value was definitely never inserted.
  bool Contains(const T& value) const noexcept {
    auto [probe, step] = HashPair(value);
    for (uint32_t i = 0; i < num_hashes_; ++i) {
      if (!IsBitSet(probe % num_bits_)) return false;
      probe += step;
    }
    return true;
  }

  /// (1 - e^(-k*n/m))^k for the current number of inserts.
  double EstimatedFalsePositiveRate() const noexcept {
    if (inserted_items_ == 0) return 0.0;
    const double m = static_cast<double>(num_bits_);
    const double k = static_cast<double>(num_hashes_);
    const double n = static_cast<double>(inserted_items_);
    return std::pow(1.0 - std::exp(-k * n / m), k);
  }

  /// Bitwise OR of another filter with the same shape into this one.
  void Merge(const BloomFilter& other) {
    if (num_bits_ != other.num_bits_ || num_hashes_ != other.num_hashes_) {
      throw IncompatibleSketches("num_bits and num_hashes must match for merge");
    }
    for (size_t i = 0; i < words_.size(); ++i) {
      words_[i] |= other.words_[i];
    }
    inserted_items_ = SaturatingAdd(inserted_items_, other.inserted_items_);
  }

  void Clear() noexcept {
    std::fill(words_.begin(), words_.end(), 0);
    inserted_items_ = 0;
  }

  size_t num_bits() const noexcept { return num_bits_; }
  uint32_t num_hashes() const noexcept { return num_hashes_; }
  uint64_t inserted_items() const noexcept { return inserted_items_; }
  bool is_empty() const noexcept { return inserted_items_ == 0; }

 private:
  static constexpr size_t kMaxBits = size_t{1} << 62;

  std::vector<uint64_t> words_;
  size_t num_bits_;
  uint32_t num_hashes_;
  uint64_t inserted_items_ = 0;

  /// Two independent hashes for double hashing, the second forced odd.
  static std::pair<uint64_t, uint64_t> HashPair(const T& value) noexcept {
    return {SeededHash(value, bloom_constants::kSeedA),
            SeededHash(value, bloom_constants::kSeedB) | 1};
  }

  void SetBit(uint64_t bit) noexcept {
    words_[bit / 64] |= uint64_t{1} << (bit % 64);
  }

  bool IsBitSet(uint64_t bit) const noexcept {
    return (words_[bit / 64] >> (bit % 64)) & 1;
  }
};

}  // namespace sketches

#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "error.hpp"
#include "hash.hpp"
#include "random_utils.hpp"
#include "saturating.hpp"

namespace sketches {

namespace cuckoo_constants {
/// Fingerprint slots per bucket.
const size_t kBucketSize = 4;
const size_t kDefaultMaxKicks = 500;
/// Target occupancy used when sizing from an expected item count.
const double kTargetLoad = 0.90;
const uint8_t kMinFingerprintBits = 4;
const uint8_t kMaxFingerprintBits = 16;
const uint64_t kIndexSeed = 0x243F6A8885A308D3ULL;
const uint64_t kFingerprintSeed = 0x13198A2E03707344ULL;
const uint64_t kAltIndexSeed = 0xA4093822299F31D0ULL;
const uint64_t kStreamSeed = 0xD6E8FD935E7A4A6DULL;
}  // namespace cuckoo_constants

/// Cuckoo filter for approximate set membership with deletion.
///
/// The filter was introduced in the paper
///   Fan, Bin, et al. "Cuckoo filter: Practically better than Bloom."
///   Proceedings of the 10th ACM International on Conference on emerging
///   Networking Experiments and Technologies. 2014.
///
/// Each item is reduced to a non-zero fingerprint which lives in one of two
/// buckets. The alternate bucket only depends on the current bucket and the
/// fingerprint, so stored fingerprints can be relocated without the item.
///
/// @tparam T the data type the filter summarizes.
template <typename T>
class CuckooFilter {
 public:
  using Bucket = std::array<uint16_t, cuckoo_constants::kBucketSize>;

  /// @param bucket_count number of buckets, a non-zero power of two.
  /// @param fingerprint_bits fingerprint width in [1, 16].
  /// @param max_kicks relocation attempts before an insert gives up.
  CuckooFilter(size_t bucket_count, uint8_t fingerprint_bits,
               size_t max_kicks = cuckoo_constants::kDefaultMaxKicks)
      : fingerprint_bits_(fingerprint_bits),
        max_kicks_(max_kicks),
        rng_(random_utils::MakeEngine(cuckoo_constants::kStreamSeed)) {
    if (bucket_count == 0 || !std::has_single_bit(bucket_count)) {
      throw InvalidParameter("bucket_count must be a non-zero power of two");
    }
    if (fingerprint_bits == 0 ||
        fingerprint_bits > cuckoo_constants::kMaxFingerprintBits) {
      throw InvalidParameter("fingerprint_bits must be in [1, 16]");
    }
    if (max_kicks == 0) {
      throw InvalidParameter("max_kicks must be greater than zero");
    }
    buckets_.assign(bucket_count, Bucket{});
  }

  /// Creates a filter sized for expected_items at the given false-positive
  /// rate.
  static CuckooFilter ForFalsePositiveRate(size_t expected_items,
                                           double false_positive_rate) {
    if (expected_items == 0) {
      throw InvalidParameter("expected_items must be greater than zero");
    }
    detail::check_open_unit(false_positive_rate, "false_positive_rate");

    const double bits = std::ceil(std::log2(1.0 / false_positive_rate)) + 1;
    const auto fingerprint_bits = static_cast<uint8_t>(
        std::clamp(bits,
                   static_cast<double>(cuckoo_constants::kMinFingerprintBits),
                   static_cast<double>(cuckoo_constants::kMaxFingerprintBits)));

    const double buckets =
        std::ceil(static_cast<double>(expected_items) /
                  cuckoo_constants::kBucketSize / cuckoo_constants::kTargetLoad);
    if (!(buckets <= static_cast<double>(kMaxBuckets))) {
      throw InvalidParameter("bucket table size overflows");
    }
    const size_t bucket_count =
        std::bit_ceil(std::max<size_t>(2, static_cast<size_t>(buckets)));
    return CuckooFilter(bucket_count, fingerprint_bits);
  }

  /// Insert a value into the filter.
  ///
  /// @return false if no slot was found within max_kicks relocations. The
  /// filter is then left exactly as it was before the call.
  bool Insert(const T& value) {
    uint16_t fingerprint = Fingerprint(value);
    const auto [index_a, index_b] = BucketIndexes(value, fingerprint);

    if (InsertIntoBucket(index_a, fingerprint) ||
        InsertIntoBucket(index_b, fingerprint)) {
      ++size_;
      return true;
    }

    size_t bucket = rng_(2) == 0 ? index_a : index_b;
    std::vector<std::pair<size_t, size_t>> path;
    path.reserve(max_kicks_);
    for (size_t kick = 0; kick < max_kicks_; ++kick) {
      const size_t slot = rng_(cuckoo_constants::kBucketSize);
      std::swap(fingerprint, buckets_[bucket][slot]);
      path.emplace_back(bucket, slot);
      bucket = AlternateIndex(bucket, fingerprint);
      if (InsertIntoBucket(bucket, fingerprint)) {
        ++size_;
        return true;
      }
    }

    // Walk the kicks back so that every evicted fingerprint returns home.
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
      std::swap(fingerprint, buckets_[it->first][it->second]);
    }
    return false;
  }

  /// @return false if the value is definitely not in the filter.
  bool Contains(const T& value) const noexcept {
    const uint16_t fingerprint = Fingerprint(value);
    const auto [index_a, index_b] = BucketIndexes(value, fingerprint);
    return BucketContains(index_a, fingerprint) ||
           BucketContains(index_b, fingerprint);
  }

  /// Removes one stored instance of the value's fingerprint.
  ///
  /// Only delete values that were inserted successfully, otherwise a
  /// colliding value may lose its fingerprint.
  ///
  /// @return true if a fingerprint was removed.
  bool Delete(const T& value) noexcept {
    const uint16_t fingerprint = Fingerprint(value);
    const auto [index_a, index_b] = BucketIndexes(value, fingerprint);
    if (RemoveFromBucket(index_a, fingerprint) ||
        RemoveFromBucket(index_b, fingerprint)) {
      --size_;
      return true;
    }
    return false;
  }

  /// Fraction of occupied slots in [0, 1].
  double LoadFactor() const noexcept {
    return static_cast<double>(size_) /
           static_cast<double>(buckets_.size() * cuckoo_constants::kBucketSize);
  }

  /// 2 * bucket_size / 2^f, at most 1.
  double ExpectedFalsePositiveRate() const noexcept {
    const double fingerprints = std::ldexp(1.0, fingerprint_bits_);
    return std::min(1.0, 2.0 * cuckoo_constants::kBucketSize / fingerprints);
  }

  void Clear() noexcept {
    std::fill(buckets_.begin(), buckets_.end(), Bucket{});
    size_ = 0;
  }

  size_t bucket_count() const noexcept { return buckets_.size(); }
  uint8_t fingerprint_bits() const noexcept { return fingerprint_bits_; }
  size_t max_kicks() const noexcept { return max_kicks_; }
  /// Number of fingerprints currently stored.
  uint64_t size() const noexcept { return size_; }
  bool is_empty() const noexcept { return size_ == 0; }

 private:
  static constexpr size_t kMaxBuckets = size_t{1} << 58;

  std::vector<Bucket> buckets_;
  uint8_t fingerprint_bits_;
  size_t max_kicks_;
  uint64_t size_ = 0;
  random_utils::Engine rng_;

  /// Low fingerprint_bits_ bits of the item hash; 0 marks an empty slot, so
  /// a zero fingerprint is bumped to 1.
  uint16_t Fingerprint(const T& value) const noexcept {
    const uint64_t mask = (uint64_t{1} << fingerprint_bits_) - 1;
    const auto fingerprint = static_cast<uint16_t>(
        SeededHash(value, cuckoo_constants::kFingerprintSeed) & mask);
    return std::max<uint16_t>(fingerprint, 1);
  }

  std::pair<size_t, size_t> BucketIndexes(const T& value,
                                          uint16_t fingerprint) const noexcept {
    const size_t index_a = static_cast<size_t>(
        SeededHash(value, cuckoo_constants::kIndexSeed) & (buckets_.size() - 1));
    return {index_a, AlternateIndex(index_a, fingerprint)};
  }

  /// XOR with the fingerprint hash is an involution: applied to either
  /// candidate bucket it yields the other one.
  size_t AlternateIndex(size_t index, uint16_t fingerprint) const noexcept {
    const auto hashed = static_cast<size_t>(
        SeededHash(fingerprint, cuckoo_constants::kAltIndexSeed));
    return (index ^ hashed) & (buckets_.size() - 1);
  }

  bool InsertIntoBucket(size_t index, uint16_t fingerprint) noexcept {
    for (auto& slot : buckets_[index]) {
      if (slot == 0) {
        slot = fingerprint;
        return true;
      }
    }
    return false;
  }

  bool RemoveFromBucket(size_t index, uint16_t fingerprint) noexcept {
    for (auto& slot : buckets_[index]) {
      if (slot == fingerprint) {
        slot = 0;
        return true;
      }
    }
    return false;
  }

  bool BucketContains(size_t index, uint16_t fingerprint) const noexcept {
    const auto& bucket = buckets_[index];
    return std::find(bucket.begin(), bucket.end(), fingerprint) != bucket.end();
  }
};

}  // namespace sketches

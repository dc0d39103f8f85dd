#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "compiler.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "saturating.hpp"

namespace sketches {

/// SpaceSaving sketch for frequent item estimation.
///
/// The implementation roughly follows the book
///   Cormode, Graham, and Ke Yi. Small summaries for big data. Cambridge
///   University Press, 2020.
/// It stores at most `capacity` counters in a hash map and evicts the minimum
/// counter by a linear scan.
///
/// The sketch was introduced in the paper
///   Metwally, Ahmed, Divyakant Agrawal, and Amr El Abbadi. "Efficient
///   computation of frequent and top-k elements in data streams." International
///   conference on database theory. Berlin, Heidelberg: Springer Berlin
///   Heidelberg, 2005.
///
/// For every tracked item count - error <= true count <= count.
///
/// @tparam T the data type the sketch summarizes.
template <typename T>
class SpaceSaving {
 public:
  /// A tracked item with its estimated count and maximum overestimation.
  struct Entry {
    T item;
    uint64_t count;
    uint64_t error;
  };

  explicit SpaceSaving(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
      throw InvalidParameter("capacity must be greater than zero");
    }
    counters_.reserve(capacity);
  }

  /// Insert one occurrence of a value.
  void Insert(const T& v) { Add(v, 1); }

  /// Insert count occurrences of a value.
  ///
  /// An untracked value arriving at a full sketch replaces the minimum
  /// counter and inherits its count as error.
  void Add(const T& v, uint64_t count) {
    if (count == 0) return;
    const auto& value = Normalized(v);
    total_count_ = SaturatingAdd(total_count_, count);

    if (auto it = counters_.find(value); it != counters_.end()) {
      it->second.count = SaturatingAdd(it->second.count, count);
      return;
    }
    if (counters_.size() < capacity_) {
      counters_.emplace(value, Counter{count, 0});
      return;
    }

    auto min_it = std::min_element(
        counters_.begin(), counters_.end(),
        [](const auto& a, const auto& b) { return a.second.count < b.second.count; });
    const uint64_t min_count = min_it->second.count;
    counters_.erase(min_it);
    counters_.emplace(value, Counter{SaturatingAdd(min_count, count), min_count});
  }

  /// Estimated count, or nullopt if the value is not tracked.
  std::optional<uint64_t> Estimate(const T& value) const {
    if (auto it = counters_.find(Normalized(value)); it != counters_.end()) {
      return it->second.count;
    }
    return std::nullopt;
  }

  /// (count, error) of a tracked value.
  std::optional<std::pair<uint64_t, uint64_t>> EstimateWithError(
      const T& value) const {
    if (auto it = counters_.find(Normalized(value)); it != counters_.end()) {
      return std::make_pair(it->second.count, it->second.error);
    }
    return std::nullopt;
  }

  /// count - error, a lower bound of the true count of a tracked value.
  std::optional<uint64_t> LowerBound(const T& value) const {
    if (auto it = counters_.find(Normalized(value)); it != counters_.end()) {
      return SaturatingSub(it->second.count, it->second.error);
    }
    return std::nullopt;
  }

  /// Up to k tracked entries sorted by count, descending.
  std::vector<Entry> TopK(size_t k) const {
    std::vector<Entry> entries;
    if (k == 0) return entries;
    entries.reserve(counters_.size());
    for (const auto& [item, counter] : counters_) {
      entries.push_back(Entry{item, counter.count, counter.error});
    }
    const auto by_count = [](const Entry& a, const Entry& b) {
      return a.count > b.count;
    };
    if (k < entries.size()) {
      std::partial_sort(entries.begin(), entries.begin() + k, entries.end(),
                        by_count);
      entries.resize(k);
    } else {
      std::sort(entries.begin(), entries.end(), by_count);
    }
    return entries;
  }

  /// Replays the tracked counts of another sketch through Add.
  ///
  /// This is an approximation that depends on the replay order and is not
  /// commutative.
  void Merge(const SpaceSaving& other) {
    if (capacity_ != other.capacity_) {
      throw IncompatibleSketches("capacity must match for merge");
    }
    if (this == &other) {
      const SpaceSaving copy(other);
      Merge(copy);
      return;
    }
    for (const auto& [item, counter] : other.counters_) {
      Add(item, counter.count);
    }
  }

  void Clear() noexcept {
    counters_.clear();
    total_count_ = 0;
  }

  size_t capacity() const noexcept { return capacity_; }
  /// Number of tracked items.
  size_t size() const noexcept { return counters_.size(); }
  uint64_t total_count() const noexcept { return total_count_; }
  bool is_empty() const noexcept { return total_count_ == 0; }

 private:
  struct Counter {
    uint64_t count;
    uint64_t error;
  };

  size_t capacity_;
  std::unordered_map<T, Counter, detail::SeededHasher<T>> counters_;
  uint64_t total_count_ = 0;

  /// Returns a normalized representation of the given value.
  ///
  /// For floating point types, +0.0 == -0.0, but they have different binary
  /// representations. Hence we return one of them.
  SKETCHES_OPT_INLINE static const T& Normalized(const auto& value) {
    if constexpr (std::is_floating_point_v<T>) {
      static constexpr T kZero = 0.0;
      return (value == kZero) ? kZero : value;
    }
    return value;
  }
};

}  // namespace sketches

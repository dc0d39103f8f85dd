#pragma once

#include <cstddef>
#include <cstdint>
#include <ranges>
#include <span>
#include <utility>
#include <vector>

#include "error.hpp"
#include "random_utils.hpp"
#include "saturating.hpp"

namespace sketches {

namespace reservoir_constants {
inline constexpr uint64_t kRandomSeed = 0x94D049BB133111EBULL;
}  // namespace reservoir_constants

/// Uniform fixed-size sample of a stream, Algorithm R from
///   Vitter, Jeffrey S. "Random sampling with a reservoir." ACM Transactions
///   on Mathematical Software (TOMS) 11.1 (1985): 37-57.
///
/// After n values every value is retained with probability capacity / n. The
/// random stream is seeded with a constant, so equal inputs give equal
/// samples.
///
/// @tparam T the sampled data type.
template <typename T>
class ReservoirSampling {
 public:
  explicit ReservoirSampling(size_t capacity)
      : capacity_(capacity),
        rng_(random_utils::MakeEngine(reservoir_constants::kRandomSeed)) {
    if (capacity == 0) {
      throw InvalidParameter("capacity must be greater than zero");
    }
    samples_.reserve(capacity);
  }

  /// Offer a value to the sample.
  void Add(T item) {
    seen_ = SaturatingAdd(seen_, uint64_t{1});
    if (samples_.size() < capacity_) {
      samples_.push_back(std::move(item));
      return;
    }
    const uint64_t index = rng_(seen_);
    if (index < capacity_) samples_[index] = std::move(item);
  }

  template <std::ranges::input_range R>
  void Extend(R&& items) {
    for (auto&& item : items) Add(T(item));
  }

  /// Retained values, in arrival order until the reservoir fills.
  std::span<const T> samples() const { return samples_; }

  /// Moves the sample out and resets the reservoir.
  std::vector<T> TakeSamples() {
    std::vector<T> taken;
    taken.swap(samples_);
    seen_ = 0;
    return taken;
  }

  void Clear() {
    samples_.clear();
    seen_ = 0;
  }

  size_t capacity() const { return capacity_; }
  /// Number of retained values.
  size_t size() const { return samples_.size(); }
  /// Number of values offered, saturating.
  uint64_t seen() const { return seen_; }
  bool is_empty() const { return seen_ == 0; }

 private:
  size_t capacity_;
  std::vector<T> samples_;
  uint64_t seen_ = 0;
  random_utils::Engine rng_;
};

}  // namespace sketches

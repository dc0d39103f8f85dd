#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ranges>
#include <string_view>
#include <type_traits>

#include "MurmurHash3.h"
#include "compiler.hpp"
#include "types.hpp"

namespace sketches {

/// Seed of the default hash function.
inline constexpr uint64_t kSeed = 9001;

namespace detail {

SKETCHES_ALWAYS_INLINE uint32_t fp_hash_bits(const float& f) {
  constexpr uint32_t kMask = std::numeric_limits<int32_t>::max();
  const auto i = std::bit_cast<uint32_t>(f);
  return (i & kMask) ? i : 0;
}

SKETCHES_ALWAYS_INLINE uint64_t fp_hash_bits(const double& f) {
  constexpr uint64_t kMask = std::numeric_limits<int64_t>::max();
  const auto i = std::bit_cast<uint64_t>(f);
  return (i & kMask) ? i : 0;
}

/// MurmurHash3_x64_128 takes a 32 bit seed. Both halves of a 64 bit seed are
/// folded into it so that seeds derived by Mix() stay distinct.
SKETCHES_OPT_INLINE constexpr uint32_t fold_seed(uint64_t seed) {
  return static_cast<uint32_t>(seed ^ (seed >> 32));
}

SKETCHES_OPT_INLINE __uint128_t HashBytes(const void* data, size_t len,
                                          uint64_t seed) {
  uint64_t out[2];
  MurmurHash3_x64_128(data, static_cast<int>(len), fold_seed(seed), out);
  return (static_cast<__uint128_t>(out[1]) << 64) | out[0];
}

/// 128 bit hash of an item's stable byte projection.
///
/// Floating point values hash their bit pattern with -0.0 mapped to +0.0.
/// Strings hash their characters, contiguous ranges of trivially copyable
/// values hash their bytes, and anything else goes through std::hash.
template <typename T>
SKETCHES_OPT_INLINE __uint128_t Hash(const T& key, uint64_t seed) {
  if constexpr (std::is_same_v<T, bool>) {
    const uint8_t byte = key ? 1 : 0;
    return HashBytes(&byte, sizeof(byte), seed);
  } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
    const auto bits = fp_hash_bits(key);
    return HashBytes(&bits, sizeof(bits), seed);
  } else if constexpr (is_string_like_v<T>) {
    const std::string_view view(key);
    return HashBytes(view.data(), view.size(), seed);
  } else if constexpr (ContiguousBytes<T>) {
    using V = std::ranges::range_value_t<T>;
    return HashBytes(std::ranges::data(key), std::ranges::size(key) * sizeof(V),
                     seed);
  } else if constexpr (std::has_unique_object_representations_v<T>) {
    return HashBytes(&key, sizeof(key), seed);
  } else if constexpr (StdHashable<T>) {
    const uint64_t projected = std::hash<T>{}(key);
    return HashBytes(&projected, sizeof(projected), seed);
  } else {
    static_assert(!sizeof(T), "Type has no stable hash projection");
  }
}

template <typename T>
SKETCHES_OPT_INLINE __uint128_t Hash(const T& key) {
  return Hash(key, kSeed);
}

/// Roll down 128 hash to 64 bit hash.
SKETCHES_OPT_INLINE constexpr uint64_t roll_down(const __uint128_t& hash) {
  return hash ^ (hash >> 64);
}

/// Hash functor for unordered containers keyed by sketch items.
template <typename T, uint64_t Seed = kSeed>
struct SeededHasher {
  size_t operator()(const T& value) const noexcept {
    return static_cast<size_t>(roll_down(Hash(value, Seed)));
  }
};

}  // namespace detail

/// Deterministic seed-parameterized 64 bit hash of an item.
template <typename T>
SKETCHES_OPT_INLINE uint64_t SeededHash(const T& item, uint64_t seed) {
  return detail::roll_down(detail::Hash(item, seed));
}

/// SplitMix64 avalanche mixer.
constexpr uint64_t Mix(uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

/// Seed of the index-th member of a hash family rooted at base.
constexpr uint64_t DeriveSeed(uint64_t index, uint64_t base) {
  return Mix(base + index);
}

}  // namespace sketches

#pragma once

#include <cstdint>
#include <random>

#include "pcg_random.hpp"

namespace sketches::random_utils {

/// Deterministic stream owned by a single sketch. Copying a sketch copies its
/// stream, so two copies fed the same input make the same choices.
using Engine = pcg64_fast;

/// Source of single random bits for coin flips.
using RandomBit = std::independent_bits_engine<pcg32_fast, 1, uint32_t>;

inline Engine MakeEngine(uint64_t seed) { return Engine(seed); }

inline RandomBit MakeRandomBit(uint64_t seed) {
  return RandomBit(pcg32_fast(seed));
}

}  // namespace sketches::random_utils

#pragma once

#include <concepts>

namespace sketches {

/// Sketches that can estimate |A n B| / |A u B| against a peer of the same
/// shape. HyperLogLog and MinHash satisfy it with unrelated internals.
template <typename S>
concept JaccardEstimator = requires(const S& a, const S& b) {
  { a.JaccardIndex(b) } -> std::convertible_to<double>;
};

/// Estimated Jaccard index of two same-shape sketches, in [0, 1].
template <JaccardEstimator S>
double JaccardIndex(const S& a, const S& b) {
  return static_cast<double>(a.JaccardIndex(b));
}

}  // namespace sketches

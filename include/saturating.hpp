#pragma once

#include <limits>
#include <type_traits>

#include "compiler.hpp"

namespace sketches {

/// a + b clamped to the bounds of T.
template <typename T>
SKETCHES_OPT_INLINE constexpr T SaturatingAdd(T a, T b) noexcept {
  static_assert(std::is_integral_v<T>);
  T result;
  if (SKETCHES_UNLIKELY(__builtin_add_overflow(a, b, &result))) {
    if constexpr (std::is_signed_v<T>) {
      return b < 0 ? std::numeric_limits<T>::min()
                   : std::numeric_limits<T>::max();
    } else {
      return std::numeric_limits<T>::max();
    }
  }
  return result;
}

/// a - b clamped to the bounds of T.
template <typename T>
SKETCHES_OPT_INLINE constexpr T SaturatingSub(T a, T b) noexcept {
  static_assert(std::is_integral_v<T>);
  T result;
  if (SKETCHES_UNLIKELY(__builtin_sub_overflow(a, b, &result))) {
    if constexpr (std::is_signed_v<T>) {
      return b < 0 ? std::numeric_limits<T>::max()
                   : std::numeric_limits<T>::min();
    } else {
      return 0;
    }
  }
  return result;
}

/// -a clamped to the bounds of T, so that -min() becomes max().
template <typename T>
SKETCHES_OPT_INLINE constexpr T SaturatingNeg(T a) noexcept {
  static_assert(std::is_signed_v<T>);
  return a == std::numeric_limits<T>::min() ? std::numeric_limits<T>::max()
                                            : -a;
}

}  // namespace sketches

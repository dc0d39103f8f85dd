#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

#include "error.hpp"

namespace sketches::detail {

/// Computes width * depth for a counter table, rejecting empty or
/// unaddressable shapes.
inline size_t table_size(size_t width, size_t depth) {
  if (width == 0) throw InvalidParameter("width must be greater than zero");
  if (depth == 0) throw InvalidParameter("depth must be greater than zero");
  size_t size;
  if (__builtin_mul_overflow(width, depth, &size)) {
    throw InvalidParameter("width * depth overflows size_t");
  }
  return size;
}

/// Converts a dimension computed in floating point, rejecting values that do
/// not fit into size_t.
inline size_t to_dimension(double value, const char* name) {
  if (!(value < 18446744073709551616.0)) {
    throw InvalidParameter(std::string(name) + " overflows size_t");
  }
  return std::max<size_t>(1, static_cast<size_t>(value));
}

/// depth = ceil(ln(1 / delta)), shared by the frequency sketches.
inline size_t depth_for_delta(double delta) {
  check_open_unit(delta, "delta");
  return to_dimension(std::ceil(std::log(1.0 / delta)), "depth");
}

}  // namespace sketches::detail

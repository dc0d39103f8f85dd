#pragma once

#include <stdexcept>
#include <string>

namespace sketches {

enum class ErrorKind {
  kInvalidParameter,
  kIncompatibleSketches,
};

/// Base class of every error raised by a sketch operation.
class SketchError : public std::logic_error {
 public:
  SketchError(ErrorKind kind, const std::string& what)
      : std::logic_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

/// A constructor or query received a value outside its domain.
class InvalidParameter : public SketchError {
 public:
  explicit InvalidParameter(const std::string& what)
      : SketchError(ErrorKind::kInvalidParameter, "invalid parameter: " + what) {}
};

/// Two sketches of different shape were combined.
class IncompatibleSketches : public SketchError {
 public:
  explicit IncompatibleSketches(const std::string& what)
      : SketchError(ErrorKind::kIncompatibleSketches,
                    "incompatible sketches: " + what) {}
};

namespace detail {

/// @return true if x is finite and strictly inside (0, 1).
inline bool is_open_unit(double x) { return x > 0.0 && x < 1.0; }

inline void check_open_unit(double x, const char* name) {
  if (!is_open_unit(x)) {
    throw InvalidParameter(std::string(name) +
                           " must be finite and strictly between 0 and 1");
  }
}

}  // namespace detail

}  // namespace sketches

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

namespace sketches::detail {

/// SFINAE helper struct to check if type T is a string with any allocator.
template <typename T>
struct is_string : std::false_type {};

/// std::basic_string with any allocator are a string.
template <typename Alloc>
struct is_string<std::basic_string<char, std::char_traits<char>, Alloc>>
    : std::true_type {};

/// Helper template to simplify usage C++17 style.
template <typename T>
inline constexpr bool is_string_v = is_string<T>::value;

/// Strings, string views and C strings are hashed by their characters.
template <typename T>
inline constexpr bool is_string_like_v =
    is_string_v<T> || std::is_same_v<T, std::string_view> ||
    std::is_same_v<T, const char*> || std::is_same_v<T, char*>;

/// A contiguous run of trivially copyable values that can be hashed as one
/// block of bytes, e.g. a slice of a MinHash signature.
template <typename T>
concept ContiguousBytes =
    std::ranges::contiguous_range<T> && std::ranges::sized_range<T> &&
    std::is_trivially_copyable_v<std::ranges::range_value_t<T>> &&
    !is_string_like_v<std::remove_cvref_t<T>>;

/// Types that carry a `std::hash` specialization.
template <typename T>
concept StdHashable = requires(const T& value) {
  { std::hash<T>{}(value) } -> std::convertible_to<size_t>;
};

}  // namespace sketches::detail

#pragma once

#include <limits>
#include <optional>
#include <type_traits>

namespace allot::util {

template <typename T>
[[nodiscard]] constexpr std::optional<T> checked_add(T lhs, T rhs) {
  static_assert(std::is_unsigned_v<T>, "checked_add expects an unsigned type");
  if (lhs > std::numeric_limits<T>::max() - rhs) {
    return std::nullopt;
  }
  return static_cast<T>(lhs + rhs);
}

template <typename T>
[[nodiscard]] constexpr std::optional<T> checked_mul(T lhs, T rhs) {
  static_assert(std::is_unsigned_v<T>, "checked_mul expects an unsigned type");
  if (lhs != 0 && rhs > std::numeric_limits<T>::max() / lhs) {
    return std::nullopt;
  }
  return static_cast<T>(lhs * rhs);
}

}  // namespace allot::util

#pragma once

#include "jobforge/core/error.hpp"

#include <charconv>
#include <concepts>
#include <string_view>

namespace jobforge::util {

template <std::integral T>
[[nodiscard]] inline auto parse_int(std::string_view s, int base = 10)
    -> Result<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return ok(value);
  }
  return fail(Error::ParseError);
}

/// Parses the longest digit prefix of `s` and advances it past the digits.
template <std::integral T>
[[nodiscard]] inline auto consume_int(std::string_view &s) -> Result<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{}) {
    return fail(Error::ParseError);
  }
  s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
  return ok(value);
}

} // namespace jobforge::util

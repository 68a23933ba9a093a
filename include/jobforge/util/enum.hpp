#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

namespace jobforge {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> std::optional<T>;

namespace util {

/// "RunOnce" -> "run_once"
[[nodiscard]] inline auto snake_case(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() * 2);
  for (auto [i, ch] : name | std::views::enumerate) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isupper(uch) != 0 && i > 0 &&
        std::islower(static_cast<unsigned char>(name[i - 1])) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

/// Snake-case spelling of every described enumerator, built once per type.
template <typename E> [[nodiscard]] auto enum_names() -> const auto & {
  using descriptors = boost::describe::describe_enumerators<E>;
  constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;

  static const auto table = [] {
    std::array<std::pair<E, std::string>, kCount> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto descriptor) {
      out[i++] = {descriptor.value, snake_case(descriptor.name)};
    });
    return out;
  }();
  return table;
}

template <typename E>
[[nodiscard]] auto enum_to_string(E value) noexcept -> std::string_view {
  for (const auto &[enum_value, text] : enum_names<E>()) {
    if (enum_value == value) {
      return text;
    }
  }
  return "unknown";
}

/// Accepts the snake-case spelling only, ignoring ASCII case. Job files and
/// control commands reject anything else instead of guessing.
template <typename E>
[[nodiscard]] auto enum_from_string(std::string_view input) noexcept
    -> std::optional<E> {
  const auto same = [](std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
      return std::tolower(static_cast<unsigned char>(x)) ==
             std::tolower(static_cast<unsigned char>(y));
    });
  };
  for (const auto &[enum_value, text] : enum_names<E>()) {
    if (same(input, text)) {
      return enum_value;
    }
  }
  return std::nullopt;
}

} // namespace util

#define JOBFORGE_DEFINE_ENUM_SERDE(EnumType)                                   \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept           \
      -> std::string_view {                                                    \
    return ::jobforge::util::enum_to_string(value);                            \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> std::optional<EnumType> {                                             \
    return ::jobforge::util::enum_from_string<EnumType>(s);                    \
  }

} // namespace jobforge

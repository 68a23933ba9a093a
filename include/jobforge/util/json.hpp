#pragma once

#include <glaze/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace jobforge {

/// Structured payload carried by action outputs and trigger events.
using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

/// Empty when no payload is attached.
[[nodiscard]] inline auto dump_json(const std::optional<JsonValue> &value)
    -> std::string {
  return value ? dump_json(*value) : std::string{};
}

/// Reads captured output as a JSON document. Only objects and arrays
/// qualify, so plain words or numbers printed by a command stay text.
[[nodiscard]] inline auto sniff_json_document(std::string_view text)
    -> std::optional<JsonValue> {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos ||
      (text[first] != '{' && text[first] != '[')) {
    return std::nullopt;
  }
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, text); ec) {
    return std::nullopt;
  }
  return value;
}

} // namespace jobforge

#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <flat_map>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

namespace jobforge::toml_util {

/// `what` names the document kind in the log line ("job file", ...).
[[nodiscard]] inline auto read_file(std::string_view path,
                                    std::string_view what)
    -> Result<std::string> {
  std::ifstream in{std::string(path), std::ios::binary};
  if (!in) {
    log::warn("Cannot read {} {}", what, path);
    return fail(Error::FileNotFound);
  }
  std::ostringstream text;
  text << in.rdbuf();
  return ok(std::move(text).str());
}

/// Keys T does not declare are skipped. The glaze error report, with the
/// offending line, goes to `diagnostic` when one is given.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::warn("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

/// Inline string tables (parameters, meta, attributes) decode into std::map;
/// the domain keeps them in a flat map with heterogeneous lookup.
[[nodiscard]] inline auto to_flat_map(const std::map<std::string, std::string> &raw)
    -> std::flat_map<std::string, std::string, std::less<>> {
  std::flat_map<std::string, std::string, std::less<>> out;
  for (const auto &[key, value] : raw) {
    out.emplace_hint(out.end(), key, value);
  }
  return out;
}

} // namespace jobforge::toml_util

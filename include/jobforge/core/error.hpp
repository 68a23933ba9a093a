#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace jobforge {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  ConfigurationError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  PermissionDenied,
  InvalidState,
  ActionFailed,
  Timeout,
  Cancelled,
  SystemNotRunning,
  ResourceExhausted,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 15> messages = {
      "success",
      "file not found",
      "parse error",
      "configuration error",
      "invalid argument",
      "not found",
      "already exists",
      "permission denied",
      "invalid state transition",
      "action failed",
      "timeout",
      "cancelled",
      "system not running",
      "resource exhausted",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "jobforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace jobforge

template <> struct std::is_error_code_enum<jobforge::Error> : std::true_type {};

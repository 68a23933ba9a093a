#pragma once

#include "jobforge/job/task.hpp"

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <unistd.h>

namespace jobforge::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}

inline auto green(std::string_view text) -> std::string {
  return colorize(text, kGreen);
}

inline auto red(std::string_view text) -> std::string {
  return colorize(text, kRed);
}

inline auto yellow(std::string_view text) -> std::string {
  return colorize(text, kYellow);
}

} // namespace ansi

inline auto status(TaskStatus s) -> std::string {
  const auto name = to_string_view(s);
  switch (s) {
  case TaskStatus::Finished:
    return ansi::green(name);
  case TaskStatus::Error:
    return ansi::red(name);
  case TaskStatus::Interrupted:
  case TaskStatus::Paused:
  case TaskStatus::Queued:
    return ansi::yellow(name);
  default:
    return std::string(name);
  }
}

} // namespace jobforge::cli::fmt

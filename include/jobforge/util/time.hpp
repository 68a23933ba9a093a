#pragma once

#include "jobforge/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace jobforge::util {

using TimePoint = std::chrono::system_clock::time_point;

// Formats time point to ISO 8601 with millisecond precision
// (YYYY-MM-DDTHH:MM:SS.mmmZ). The epoch formats as an empty string.
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

/// ISO-8601 date-time: `YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]`.
/// Without a designator the instant is taken as UTC.
[[nodiscard]] auto parse_iso8601_instant(std::string_view text)
    -> Result<TimePoint>;

/// ISO-8601 duration: `P[nY][nM][nW][nD][T[nH][nM][n[.f]S]]`. Years count as
/// 365 days and months as 30 days.
[[nodiscard]] auto parse_iso8601_duration(std::string_view text)
    -> Result<std::chrono::milliseconds>;

[[nodiscard]] auto format_iso8601_duration(std::chrono::milliseconds d)
    -> std::string;

} // namespace jobforge::util

#include "jobforge/scheduler/schedule.hpp"

#include "jobforge/util/conv.hpp"
#include "jobforge/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

namespace jobforge {

namespace {

// Periods and deltas are added to system_clock instants, whose nanosecond
// range ends around 2262.
constexpr auto kMaxScheduleSpan =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::days{100 * 365});

[[nodiscard]] auto split(std::string_view text, char sep)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t pos = 0;
  while (true) {
    auto next = text.find(sep, pos);
    parts.push_back(text.substr(pos, next - pos));
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 1;
  }
  return parts;
}

} // namespace

auto parse_repeating_interval(std::string_view text, util::TimePoint now)
    -> Result<RepeatingInterval> {
  auto parts = split(text, '/');
  if (parts.size() < 2 || parts.size() > 3 || parts[0].empty() ||
      parts[0].front() != 'R') {
    return fail(Error::ConfigurationError);
  }

  RepeatingInterval out{};
  auto count = parts[0].substr(1);
  if (!count.empty()) {
    auto n = util::parse_int<std::uint64_t>(count);
    if (!n) {
      return fail(Error::ConfigurationError);
    }
    out.repetitions = *n;
  }

  auto period = util::parse_iso8601_duration(parts.back());
  if (!period || period->count() <= 0 || *period > kMaxScheduleSpan) {
    return fail(Error::ConfigurationError);
  }
  out.period = *period;

  if (parts.size() == 3) {
    auto start = util::parse_iso8601_instant(parts[1]);
    if (!start) {
      return fail(Error::ConfigurationError);
    }
    out.start = *start;
  } else {
    out.start = now + out.period;
  }
  return ok(out);
}

auto parse_schedule(const Schedule &schedule, util::TimePoint now)
    -> Result<ParsedSchedule> {
  auto interval = parse_repeating_interval(schedule.iso8601_schedule, now);
  if (!interval) {
    log::warn("Malformed schedule '{}'", schedule.iso8601_schedule);
    return fail(interval.error());
  }

  ParsedSchedule out{.interval = *interval};
  if (!schedule.iso8601_min_delta.empty()) {
    auto delta = util::parse_iso8601_duration(schedule.iso8601_min_delta);
    if (!delta || *delta > kMaxScheduleSpan) {
      log::warn("Malformed min delta '{}'", schedule.iso8601_min_delta);
      return fail(Error::ConfigurationError);
    }
    out.min_delta = *delta;
  }
  return ok(out);
}

auto ScheduleCursor::nominal(std::uint64_t index) const -> util::TimePoint {
  return schedule_.interval.start +
         std::chrono::duration_cast<util::TimePoint::duration>(
             schedule_.interval.period * static_cast<std::int64_t>(index));
}

auto ScheduleCursor::exhausted() const noexcept -> bool {
  return schedule_.interval.repetitions != 0 &&
         index_ >= schedule_.interval.repetitions;
}

auto ScheduleCursor::skip_until(util::TimePoint after) -> void {
  if (after < schedule_.interval.start) {
    return;
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      after - schedule_.interval.start);
  auto past = static_cast<std::uint64_t>(elapsed / schedule_.interval.period) +
              1;
  if (schedule_.interval.repetitions != 0) {
    past = std::min(past, schedule_.interval.repetitions);
  }
  index_ = std::max(index_, past);
}

auto ScheduleCursor::next() const -> std::optional<util::TimePoint> {
  if (exhausted()) {
    return std::nullopt;
  }
  auto at = nominal(index_);
  if (last_firing_ && schedule_.min_delta.count() > 0) {
    at = std::max(at, *last_firing_ + schedule_.min_delta);
  }
  return at;
}

auto ScheduleCursor::record_firing(util::TimePoint actual) -> void {
  if (exhausted()) {
    return;
  }
  ++index_;
  last_firing_ = actual;
}

auto next_fire_times(ParsedSchedule schedule, util::TimePoint after)
    -> std::generator<util::TimePoint> {
  ScheduleCursor cursor(schedule);
  cursor.skip_until(after);
  while (auto at = cursor.next()) {
    co_yield *at;
    cursor.record_firing(*at);
  }
}

} // namespace jobforge

#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/job/job.hpp"
#include "jobforge/util/time.hpp"

#include <chrono>
#include <cstdint>
#include <generator>
#include <optional>
#include <string_view>

namespace jobforge {

struct RepeatingInterval {
  std::uint64_t repetitions{0}; // 0 = unbounded
  util::TimePoint start{};
  std::chrono::milliseconds period{0};

  auto operator==(const RepeatingInterval &) const -> bool = default;
};

/// `R[n]/start/period` or `R[n]/period`. Without a start the interval is
/// anchored at `now` and first fires one period later.
[[nodiscard]] auto parse_repeating_interval(std::string_view text,
                                            util::TimePoint now)
    -> Result<RepeatingInterval>;

struct ParsedSchedule {
  RepeatingInterval interval;
  std::chrono::milliseconds min_delta{0};
};

[[nodiscard]] auto parse_schedule(const Schedule &schedule, util::TimePoint now)
    -> Result<ParsedSchedule>;

// Walks the occurrences of a schedule. Each firing consumes one occurrence;
// the next firing is never earlier than the previous actual firing plus the
// minimum delta.
class ScheduleCursor {
public:
  explicit ScheduleCursor(ParsedSchedule schedule) noexcept
      : schedule_(schedule) {}

  /// Consume, without firing, every occurrence at or before `after`.
  auto skip_until(util::TimePoint after) -> void;

  [[nodiscard]] auto next() const -> std::optional<util::TimePoint>;
  auto record_firing(util::TimePoint actual) -> void;

  [[nodiscard]] auto exhausted() const noexcept -> bool;
  [[nodiscard]] auto consumed() const noexcept -> std::uint64_t {
    return index_;
  }
  [[nodiscard]] auto last_firing() const noexcept
      -> std::optional<util::TimePoint> {
    return last_firing_;
  }
  [[nodiscard]] auto schedule() const noexcept -> const ParsedSchedule & {
    return schedule_;
  }

private:
  [[nodiscard]] auto nominal(std::uint64_t index) const -> util::TimePoint;

  ParsedSchedule schedule_;
  std::uint64_t index_{0};
  std::optional<util::TimePoint> last_firing_;
};

/// Fire times strictly after `after`, each one taken as the actual firing of
/// its predecessor. Infinite for unbounded schedules.
[[nodiscard]] auto next_fire_times(ParsedSchedule schedule,
                                   util::TimePoint after)
    -> std::generator<util::TimePoint>;

} // namespace jobforge

#include "jobforge/cli/commands.hpp"
#include "jobforge/scheduler/schedule.hpp"
#include "jobforge/util/json.hpp"
#include "jobforge/util/log.hpp"
#include "jobforge/util/time.hpp"

#include <chrono>
#include <print>
#include <ranges>
#include <vector>

namespace jobforge::cli {

auto cmd_schedule(const ScheduleOptions &opts) -> int {
  log::set_output_stderr();

  auto after = std::chrono::system_clock::now();
  if (!opts.after.empty()) {
    auto parsed = util::parse_iso8601_instant(opts.after);
    if (!parsed) {
      std::println(stderr, "Error: --after is not an ISO-8601 instant: {}",
                   opts.after);
      return 1;
    }
    after = *parsed;
  }

  auto schedule = parse_schedule(
      Schedule{.iso8601_schedule = opts.schedule,
               .iso8601_min_delta = opts.min_delta},
      after);
  if (!schedule) {
    std::println(stderr, "Error: Invalid schedule '{}': {}", opts.schedule,
                 schedule.error().message());
    return 1;
  }

  std::vector<std::string> times;
  for (auto tp : next_fire_times(*schedule, after) |
                     std::views::take(opts.count)) {
    times.push_back(util::format_iso8601(tp));
  }

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (auto &t : times) {
      arr.get_array().emplace_back(std::move(t));
    }
    JsonValue output{
        {"schedule", opts.schedule},
        {"min_delta", opts.min_delta},
        {"fire_times", std::move(arr)},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  if (times.empty()) {
    std::println("No firings after {}", util::format_iso8601(after));
    return 0;
  }
  for (const auto &[i, t] : std::views::enumerate(times)) {
    std::println("{:>4}  {}", i + 1, t);
  }
  return 0;
}

} // namespace jobforge::cli

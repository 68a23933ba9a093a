#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/job/action.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/util/id.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

struct Schedule {
  /// `R[n]/[start/]period`, e.g. `R3/2024-01-01T00:00:00Z/PT5S`.
  std::string iso8601_schedule;
  /// Minimum spacing between two firings, e.g. `PT2S`. Empty = none.
  std::string iso8601_min_delta;

  auto operator==(const Schedule &) const -> bool = default;
};

struct Job {
  JobId id;
  std::string label;
  std::string owner;
  bool inactive{false};
  std::vector<std::string> languages;

  std::vector<std::string> event_names;
  std::optional<Schedule> schedule;
  bool auto_start{false};

  ActionTree actions;
  /// <= 0 uses the configured default.
  int max_concurrency{0};
  bool auto_clean{false};
  bool tasks_silent_update{false};

  /// Filled only when a read asks for it.
  std::vector<Task> tasks;

  [[nodiscard]] auto has_schedule() const noexcept -> bool {
    return schedule.has_value() && !schedule->iso8601_schedule.empty();
  }

  [[nodiscard]] auto listens_to(std::string_view event) const -> bool {
    return std::ranges::find(event_names, event) != event_names.end();
  }
};

/// Structural checks only; schedule strings are parsed by the engine.
[[nodiscard]] auto validate_job(const Job &job) -> Result<void>;

class JobBuilder {
public:
  explicit JobBuilder(JobId id) { job_.id = std::move(id); }

  auto label(std::string value) -> JobBuilder & {
    job_.label = std::move(value);
    return *this;
  }
  auto owner(std::string value) -> JobBuilder & {
    job_.owner = std::move(value);
    return *this;
  }
  auto inactive(bool value = true) -> JobBuilder & {
    job_.inactive = value;
    return *this;
  }
  auto on_event(std::string name) -> JobBuilder & {
    job_.event_names.push_back(std::move(name));
    return *this;
  }
  auto schedule(std::string iso8601, std::string min_delta = {})
      -> JobBuilder & {
    job_.schedule = Schedule{.iso8601_schedule = std::move(iso8601),
                             .iso8601_min_delta = std::move(min_delta)};
    return *this;
  }
  auto auto_start(bool value = true) -> JobBuilder & {
    job_.auto_start = value;
    return *this;
  }
  auto auto_clean(bool value = true) -> JobBuilder & {
    job_.auto_clean = value;
    return *this;
  }
  auto silent_tasks(bool value = true) -> JobBuilder & {
    job_.tasks_silent_update = value;
    return *this;
  }
  auto max_concurrency(int value) -> JobBuilder & {
    job_.max_concurrency = value;
    return *this;
  }
  auto actions(ActionTree tree) -> JobBuilder & {
    job_.actions = std::move(tree);
    return *this;
  }

  [[nodiscard]] auto build() && -> Result<Job>;

private:
  Job job_;
};

} // namespace jobforge

#pragma once

#include "jobforge/job/action.hpp"
#include "jobforge/selector/entity.hpp"
#include "jobforge/util/enum.hpp"
#include "jobforge/util/id.hpp"
#include "jobforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jobforge {

enum class TaskStatus : std::uint8_t {
  Unknown,
  Idle,
  Running,
  Finished,
  Interrupted,
  Paused,
  Any,
  Error,
  Queued,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Unknown, Idle, Running, Finished, Interrupted,
                    Paused, Any, Error, Queued)
JOBFORGE_DEFINE_ENUM_SERDE(TaskStatus)

[[nodiscard]] constexpr bool is_terminal(TaskStatus s) noexcept {
  return s == TaskStatus::Finished || s == TaskStatus::Error ||
         s == TaskStatus::Interrupted;
}

/// Running and Paused tasks hold one of their job's concurrency slots.
[[nodiscard]] constexpr bool occupies_slot(TaskStatus s) noexcept {
  return s == TaskStatus::Running || s == TaskStatus::Paused;
}

/// `Any` and `Unknown` act as wildcards in queries.
[[nodiscard]] constexpr bool status_matches(TaskStatus filter,
                                            TaskStatus actual) noexcept {
  return filter == TaskStatus::Any || filter == TaskStatus::Unknown ||
         filter == actual;
}

struct ActionOutput {
  bool success{true};
  std::string raw_body;
  std::string string_body;
  std::optional<JsonValue> json_body;
  std::string error_string;
  bool ignored{false};
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] static auto skipped(std::string reason) -> ActionOutput {
    return ActionOutput{.success = true,
                        .string_body = std::move(reason),
                        .ignored = true};
  }

  [[nodiscard]] static auto failure(std::string error) -> ActionOutput {
    return ActionOutput{.success = false, .error_string = std::move(error)};
  }
};

struct ActionMessage {
  std::optional<JsonValue> event;
  std::vector<Node> nodes;
  std::vector<User> users;
  std::vector<ActivityObject> activities;
  std::vector<ActionOutput> output_chain;

  auto append_output(ActionOutput output) -> void {
    output_chain.push_back(std::move(output));
  }

  [[nodiscard]] auto last_output() const noexcept -> const ActionOutput * {
    return output_chain.empty() ? nullptr : &output_chain.back();
  }
};

struct ActionLog {
  ActionIndex action_index{kInvalidAction};
  ActionId action_id;
  /// "<root>:<entity>/<child>:<entity>/..." identifies the concurrent branch
  /// and the entity ordinal that produced the entry.
  std::string branch;
  ActionMessage input;
  ActionMessage output;
};

struct Task {
  TaskId id;
  JobId job_id;
  TaskStatus status{TaskStatus::Idle};
  std::string status_message;
  std::string trigger_owner;
  std::chrono::system_clock::time_point start_time{};
  std::chrono::system_clock::time_point end_time{};
  bool can_stop{true};
  bool can_pause{true};
  bool has_progress{true};
  float progress{0.0F};
  std::vector<ActionLog> action_logs;
  std::chrono::system_clock::time_point last_update{};
};

} // namespace jobforge

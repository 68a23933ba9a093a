#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace jobforge::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<int> shards;
};

struct ValidateOptions {
  std::string config_file;
  std::optional<std::string> file; // Specific job TOML file
  bool json{false};
};

struct ScheduleOptions {
  std::string schedule;
  std::string min_delta;
  std::string after; // ISO-8601 instant; empty = now
  std::size_t count{10};
  bool json{false};
};

struct RunOptions {
  std::string config_file;
  std::string job_id;
  int timeout_sec{3600};
  bool json{false};
};

[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_schedule(const ScheduleOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;

} // namespace jobforge::cli

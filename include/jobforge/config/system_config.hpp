#pragma once

#include <string>

namespace jobforge {

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  int shards{0}; // 0 = auto (hardware_concurrency)
  int default_max_concurrency{0}; // 0 = unbounded
  int stuck_sweep_interval_sec{60};
  int stuck_task_timeout_sec{600};
  int catalog_page_size{256};

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct JobSourceConfig {
  std::string directory{"./jobs"};
  std::string catalog_file;

  auto operator==(const JobSourceConfig &) const -> bool = default;
};

struct SystemConfig {
  SchedulerConfig scheduler;
  JobSourceConfig job_source;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace jobforge

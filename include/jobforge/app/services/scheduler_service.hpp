#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/scheduler/engine.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>

namespace jobforge {

class Runtime;

using StuckSweepCallback = std::move_only_function<task<Result<std::size_t>>(
    std::chrono::system_clock::time_point)>;

// Owns the schedule engine and the periodic stuck-task sweep.
class SchedulerService {
public:
  explicit SchedulerService(Runtime &runtime);
  ~SchedulerService();

  SchedulerService(const SchedulerService &) = delete;
  auto operator=(const SchedulerService &) -> SchedulerService & = delete;

  auto set_on_trigger(ScheduleEngine::TriggerCallback callback) -> void;
  auto set_stuck_sweep_callback(StuckSweepCallback callback) -> void;
  /// interval 0 disables the sweep.
  auto set_stuck_sweep_config(int interval_sec, int task_timeout_sec) -> void;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const -> bool;

  [[nodiscard]] auto engine() -> ScheduleEngine &;

private:
  auto sweep_loop() -> spawn_task;

  Runtime &runtime_;
  ScheduleEngine engine_;
  StuckSweepCallback stuck_sweep_callback_;
  int stuck_sweep_interval_sec_{60};
  int stuck_task_timeout_sec_{600};
  std::atomic<bool> sweep_running_{false};
  std::atomic<int> sweep_inflight_{0};
};

} // namespace jobforge

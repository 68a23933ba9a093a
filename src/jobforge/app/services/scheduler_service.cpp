#include "jobforge/app/services/scheduler_service.hpp"

#include "jobforge/core/runtime.hpp"
#include "jobforge/util/log.hpp"

#include <thread>

namespace jobforge {

SchedulerService::SchedulerService(Runtime &runtime)
    : runtime_(runtime), engine_(runtime) {}

SchedulerService::~SchedulerService() { stop(); }

auto SchedulerService::set_on_trigger(ScheduleEngine::TriggerCallback callback)
    -> void {
  engine_.set_on_trigger(std::move(callback));
}

auto SchedulerService::set_stuck_sweep_callback(StuckSweepCallback callback)
    -> void {
  stuck_sweep_callback_ = std::move(callback);
}

auto SchedulerService::set_stuck_sweep_config(int interval_sec,
                                              int task_timeout_sec) -> void {
  stuck_sweep_interval_sec_ = interval_sec;
  stuck_task_timeout_sec_ = task_timeout_sec;
}

auto SchedulerService::start() -> void {
  engine_.start();

  if (stuck_sweep_interval_sec_ <= 0 || stuck_task_timeout_sec_ <= 0) {
    log::info("Stuck-task sweep disabled");
    return;
  }
  if (sweep_running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  runtime_.spawn_on(kControlShard, sweep_loop());
  log::info("Stuck-task sweep every {}s (timeout {}s)",
            stuck_sweep_interval_sec_, stuck_task_timeout_sec_);
}

auto SchedulerService::sweep_loop() -> spawn_task {
  while (sweep_running_.load(std::memory_order_acquire)) {
    if (!co_await async_sleep(std::chrono::seconds(stuck_sweep_interval_sec_))) {
      break;
    }
    if (!sweep_running_.load(std::memory_order_acquire)) {
      break;
    }
    if (!stuck_sweep_callback_) {
      continue;
    }

    const auto since = std::chrono::system_clock::now() -
                       std::chrono::seconds(stuck_task_timeout_sec_);
    sweep_inflight_.fetch_add(1, std::memory_order_acq_rel);
    auto swept = co_await stuck_sweep_callback_(since);
    sweep_inflight_.fetch_sub(1, std::memory_order_acq_rel);
    if (!swept) {
      log::warn("Stuck-task sweep failed: {}", swept.error().message());
      continue;
    }
    if (*swept > 0) {
      log::warn("Stuck-task sweep interrupted {} task(s)", *swept);
    }
  }
  log::debug("Stuck-task sweep loop exited");
}

auto SchedulerService::stop() -> void {
  sweep_running_.store(false, std::memory_order_release);

  // Let an in-flight sweep finish before the store goes away.
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
  while (sweep_inflight_.load(std::memory_order_acquire) > 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  engine_.stop();
}

auto SchedulerService::is_running() const -> bool {
  return engine_.is_running();
}

auto SchedulerService::engine() -> ScheduleEngine & { return engine_; }

} // namespace jobforge

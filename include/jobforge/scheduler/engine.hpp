#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/job/events.hpp"
#include "jobforge/scheduler/event_queue.hpp"
#include "jobforge/scheduler/schedule.hpp"
#include "jobforge/util/id.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace jobforge {

class Runtime;

// One timer loop per scheduled job. All state lives on the control shard;
// calls from other threads are posted there.
class ScheduleEngine {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  using TriggerCallback = std::move_only_function<void(JobTriggerEvent)>;

  explicit ScheduleEngine(Runtime &runtime);
  ~ScheduleEngine();

  ScheduleEngine(const ScheduleEngine &) = delete;
  auto operator=(const ScheduleEngine &) -> ScheduleEngine & = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// Parses the schedule on the calling thread; a malformed schedule is
  /// reported here and nothing is registered. Re-adding a job replaces its
  /// timer.
  [[nodiscard]] auto add_job(const JobId &job_id, const Schedule &schedule)
      -> Result<void>;
  auto remove_job(const JobId &job_id) -> void;

  auto set_on_trigger(TriggerCallback cb) -> void;

  // Control shard only.
  [[nodiscard]] auto next_fire_time(const JobId &job_id) const
      -> std::optional<TimePoint>;
  [[nodiscard]] auto scheduled_count() const noexcept -> std::size_t {
    return scheduled_.size();
  }

private:
  struct ScheduledJob {
    Schedule schedule;
    ScheduleCursor cursor;
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  auto run_job_timer(JobId job_id, std::shared_ptr<boost::asio::steady_timer>
                                       timer) -> spawn_task;
  auto dispatch(SchedulerEvent event) -> void;

  auto handle_event(AddJobEvent e) -> void;
  auto handle_event(const RemoveJobEvent &e) -> void;
  auto handle_event(const ShutdownEvent &e) -> void;

  Runtime &runtime_;
  alignas(64) std::atomic<bool> running_{false};
  alignas(64) std::atomic<bool> stopped_{true};

  // Accessed only on the control shard
  ankerl::unordered_dense::map<JobId, ScheduledJob> scheduled_;
  TriggerCallback on_trigger_;
};

} // namespace jobforge

#include "jobforge/scheduler/engine.hpp"

#include "jobforge/core/runtime.hpp"
#include "jobforge/util/log.hpp"
#include "jobforge/util/time.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>
#include <variant>

namespace jobforge {

ScheduleEngine::ScheduleEngine(Runtime &runtime) : runtime_(runtime) {}

ScheduleEngine::~ScheduleEngine() { stop(); }

auto ScheduleEngine::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  stopped_.store(false, std::memory_order_release);
  log::info("Schedule engine started");
}

auto ScheduleEngine::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  if (!runtime_.is_running() ||
      runtime_.current_shard() == kControlShard) {
    handle_event(ShutdownEvent{});
    log::info("Schedule engine stopped");
    return;
  }

  dispatch(ShutdownEvent{});

  constexpr auto kStopTimeout = std::chrono::seconds(5);
  const auto deadline = std::chrono::steady_clock::now() + kStopTimeout;
  while (!stopped_.load(std::memory_order_acquire)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      log::warn("Schedule engine stop timed out waiting for timers");
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  log::info("Schedule engine stopped");
}

auto ScheduleEngine::dispatch(SchedulerEvent event) -> void {
  if (runtime_.current_shard() == kControlShard) {
    std::visit([this](auto &&e) { handle_event(std::move(e)); },
               std::move(event));
    return;
  }
  runtime_.post_to(kControlShard, [this, event = std::move(event)]() mutable {
    std::visit([this](auto &&e) { handle_event(std::move(e)); },
               std::move(event));
  });
}

auto ScheduleEngine::add_job(const JobId &job_id, const Schedule &schedule)
    -> Result<void> {
  if (!running_.load(std::memory_order_acquire)) {
    return fail(Error::SystemNotRunning);
  }
  auto parsed = parse_schedule(schedule, std::chrono::system_clock::now());
  if (!parsed) {
    log::warn("Job {} has an invalid schedule and will not be timed: {}",
              job_id, parsed.error().message());
    return fail(parsed.error());
  }
  dispatch(AddJobEvent{
      .job_id = job_id, .schedule = schedule, .parsed = *parsed});
  return ok();
}

auto ScheduleEngine::remove_job(const JobId &job_id) -> void {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  dispatch(RemoveJobEvent{.job_id = job_id});
}

auto ScheduleEngine::set_on_trigger(TriggerCallback cb) -> void {
  on_trigger_ = std::move(cb);
}

auto ScheduleEngine::next_fire_time(const JobId &job_id) const
    -> std::optional<TimePoint> {
  auto it = scheduled_.find(job_id);
  if (it == scheduled_.end()) {
    return std::nullopt;
  }
  return it->second.cursor.next();
}

auto ScheduleEngine::run_job_timer(
    JobId job_id, std::shared_ptr<boost::asio::steady_timer> timer)
    -> spawn_task {
  while (running_.load(std::memory_order_acquire)) {
    auto it = scheduled_.find(job_id);
    if (it == scheduled_.end() || it->second.timer.get() != timer.get()) {
      co_return;
    }

    auto next_time = it->second.cursor.next();
    if (!next_time) {
      log::info("Job {} schedule exhausted after {} firings", job_id,
                it->second.cursor.consumed());
      scheduled_.erase(it);
      co_return;
    }

    auto delay = *next_time - std::chrono::system_clock::now();
    if (delay < TimePoint::duration::zero()) {
      delay = TimePoint::duration::zero();
    }
    timer->expires_after(
        std::chrono::duration_cast<boost::asio::steady_timer::duration>(delay));

    auto [ec] = co_await timer->async_wait(use_nothrow);
    if (ec == boost::asio::error::operation_aborted) {
      co_return;
    }
    if (ec) {
      log::warn("Schedule timer wait failed for {}: {}", job_id, ec.message());
      co_return;
    }

    // The entry may have been replaced or removed while waiting.
    it = scheduled_.find(job_id);
    if (it == scheduled_.end() || it->second.timer.get() != timer.get()) {
      co_return;
    }

    const auto fired_at = std::chrono::system_clock::now();
    it->second.cursor.record_firing(fired_at);
    log::debug("Schedule fired job {} at {}", job_id,
               util::format_iso8601(fired_at));

    if (on_trigger_) {
      on_trigger_(JobTriggerEvent{.job_id = job_id,
                                  .schedule = it->second.schedule,
                                  .run_now = false,
                                  .fired_at = fired_at});
    }
  }
}

auto ScheduleEngine::handle_event(AddJobEvent e) -> void {
  if (auto it = scheduled_.find(e.job_id); it != scheduled_.end()) {
    it->second.timer->cancel();
    scheduled_.erase(it);
  }

  ScheduleCursor cursor(e.parsed);
  cursor.skip_until(std::chrono::system_clock::now());
  if (cursor.exhausted()) {
    log::info("Job {} not scheduled: every occurrence is in the past",
              e.job_id);
    return;
  }

  auto timer = std::make_shared<boost::asio::steady_timer>(
      runtime_.executor_for(kControlShard));
  auto first = cursor.next();
  scheduled_.insert_or_assign(e.job_id,
                              ScheduledJob{.schedule = std::move(e.schedule),
                                           .cursor = cursor,
                                           .timer = timer});
  co_spawn(runtime_.executor_for(kControlShard),
           run_job_timer(e.job_id, std::move(timer)), detached);

  log::info("Job {} scheduled, next firing at {}", e.job_id,
            first ? util::format_iso8601(*first) : std::string{"never"});
}

auto ScheduleEngine::handle_event(const RemoveJobEvent &e) -> void {
  auto it = scheduled_.find(e.job_id);
  if (it == scheduled_.end()) {
    return;
  }
  it->second.timer->cancel();
  scheduled_.erase(it);
  log::info("Job {} unscheduled", e.job_id);
}

auto ScheduleEngine::handle_event(const ShutdownEvent &) -> void {
  for (auto &[id, scheduled] : scheduled_) {
    if (scheduled.timer) {
      scheduled.timer->cancel();
    }
  }
  scheduled_.clear();
  stopped_.store(true, std::memory_order_release);
}

} // namespace jobforge

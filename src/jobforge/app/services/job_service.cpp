#include "jobforge/app/services/job_service.hpp"

#include "jobforge/core/runtime.hpp"
#include "jobforge/scheduler/engine.hpp"
#include "jobforge/store/job_store.hpp"
#include "jobforge/supervisor/stuck_detector.hpp"
#include "jobforge/supervisor/task_supervisor.hpp"
#include "jobforge/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <memory>
#include <ranges>
#include <utility>

namespace jobforge {

namespace {

// Most recent first: by end time, then start time, then id.
[[nodiscard]] auto more_recent(const Task &a, const Task &b) -> bool {
  if (a.end_time != b.end_time) {
    return a.end_time > b.end_time;
  }
  if (a.start_time != b.start_time) {
    return a.start_time > b.start_time;
  }
  return a.id.value() > b.id.value();
}

} // namespace

JobService::JobService(Runtime &runtime, JobStore &store,
                       TaskSupervisor &supervisor, ScheduleEngine &engine,
                       StuckTaskDetector &detector, ChangePublisher &publisher)
    : runtime_(runtime), store_(store), supervisor_(supervisor),
      engine_(engine), detector_(detector), publisher_(publisher) {}

auto JobService::put_job(Job job) -> task<Result<void>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, job = std::move(job)]() mutable {
        return put_job_local(std::move(job));
      });
}

auto JobService::get_job(JobId id, std::optional<TaskStatus> load_tasks)
    -> task<Result<Job>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, id = std::move(id), load_tasks] {
        return get_job_local(id, load_tasks);
      });
}

auto JobService::delete_job(JobId id) -> task<Result<void>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, id = std::move(id)] { return delete_job_local(id); });
}

auto JobService::delete_cleanable_jobs() -> task<Result<std::size_t>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this] { return delete_cleanable_jobs_local(); });
}

auto JobService::list_jobs(ListJobsRequest request)
    -> task<Result<std::vector<Job>>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, request = std::move(request)] {
        return list_jobs_local(request);
      });
}

auto JobService::put_task(Task task) -> task<Result<void>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, task = std::move(task)]() mutable {
        return put_task_local(std::move(task));
      });
}

auto JobService::get_task(TaskId id) -> task<Result<Task>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, id = std::move(id)] { return store_.get_task(id); });
}

auto JobService::put_tasks(std::vector<Task> batch)
    -> task<Result<std::size_t>> {
  co_return co_await runtime_.invoke_on(
      kControlShard,
      [this, batch = std::move(batch)]() mutable -> Result<std::size_t> {
        std::size_t stored = 0;
        for (auto &t : batch) {
          if (auto r = put_task_local(std::move(t)); !r) {
            return fail(r.error());
          }
          ++stored;
        }
        return ok(stored);
      });
}

auto JobService::list_tasks(JobId job_id, TaskStatus status)
    -> task<Result<std::vector<Task>>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, job_id = std::move(job_id), status] {
        return store_.list_tasks(job_id, status);
      });
}

auto JobService::delete_tasks(DeleteTasksRequest request)
    -> task<Result<std::vector<TaskId>>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, request = std::move(request)] {
        return delete_tasks_local(request);
      });
}

auto JobService::detect_stuck_tasks(std::chrono::system_clock::time_point since)
    -> task<Result<std::vector<TaskId>>> {
  co_return co_await detector_.sweep(since);
}

auto JobService::control(CtrlCommand cmd)
    -> task<Result<CtrlCommandResponse>> {
  co_return co_await supervisor_.control(std::move(cmd));
}

auto JobService::trigger(JobTriggerEvent event)
    -> task<Result<std::optional<Task>>> {
  co_return co_await runtime_.invoke_on(
      kControlShard,
      [this, event = std::move(event)] { return trigger_local(event); });
}

auto JobService::dispatch_event(std::string event_name, ActionMessage message)
    -> task<Result<std::vector<TaskId>>> {
  co_return co_await runtime_.invoke_on(
      kControlShard,
      [this, event_name = std::move(event_name),
       message = std::move(message)] {
        return dispatch_event_local(event_name, message);
      });
}

auto JobService::put_job_local(Job job) -> Result<void> {
  if (auto r = validate_job(job); !r) {
    log::warn("Rejected job '{}': {}", job.id, r.error().message());
    return r;
  }
  job.tasks.clear();

  const bool first_store = !store_.get_job(job.id).has_value();
  auto snapshot = std::make_shared<const Job>(job);
  if (auto r = store_.put_job(std::move(job)); !r) {
    log::error("Failed to store job '{}': {}", snapshot->id,
               r.error().message());
    return r;
  }

  if (snapshot->has_schedule()) {
    // A malformed schedule leaves the job stored but never timed.
    if (auto r = engine_.add_job(snapshot->id, *snapshot->schedule); !r) {
      log::warn("Job '{}' stored without a timer: {}", snapshot->id,
                r.error().message());
    }
  } else {
    engine_.remove_job(snapshot->id);
  }

  publisher_.publish(JobChangeEvent{.updated = snapshot});
  log::info("Job '{}' {}", snapshot->id, first_store ? "created" : "updated");

  if (first_store && snapshot->auto_start && !snapshot->inactive) {
    if (auto t = supervisor_.fire_local(
            snapshot->id, FireRequest{.trigger_owner = "auto_start"});
        !t) {
      log::error("Auto-start of job '{}' failed: {}", snapshot->id,
                 t.error().message());
    }
  }
  return ok();
}

auto JobService::get_job_local(const JobId &id,
                               std::optional<TaskStatus> load_tasks)
    -> Result<Job> {
  auto job = store_.get_job(id);
  if (!job || !load_tasks) {
    return job;
  }
  auto tasks = store_.list_tasks(id, *load_tasks);
  if (!tasks) {
    return fail(tasks.error());
  }
  job->tasks = std::move(*tasks);
  return job;
}

auto JobService::delete_job_local(const JobId &id) -> Result<void> {
  if (!store_.get_job(id)) {
    return fail(Error::NotFound);
  }
  engine_.remove_job(id);
  if (auto stopped = supervisor_.stop_job_tasks(id, "job deleted");
      stopped > 0) {
    log::info("Stopped {} live task(s) of deleted job '{}'", stopped, id);
  }
  if (auto r = store_.delete_job(id); !r) {
    return r;
  }
  publisher_.publish(JobChangeEvent{.removed = id});
  log::info("Job '{}' deleted", id);
  return ok();
}

auto JobService::has_live_tasks(const JobId &id) const -> bool {
  return std::ranges::any_of(supervisor_.live_tasks(),
                             [&](const auto &t) { return t.job_id == id; });
}

auto JobService::delete_cleanable_jobs_local() -> Result<std::size_t> {
  auto jobs = store_.list_jobs();
  if (!jobs) {
    return fail(jobs.error());
  }
  std::size_t removed = 0;
  for (const auto &job : *jobs) {
    if (!job.auto_clean || has_live_tasks(job.id)) {
      continue;
    }
    auto finished = store_.list_tasks(job.id, TaskStatus::Finished);
    if (!finished || finished->empty()) {
      continue;
    }
    if (auto r = delete_job_local(job.id); r) {
      ++removed;
    }
  }
  if (removed > 0) {
    log::info("Removed {} cleanable job(s)", removed);
  }
  return ok(removed);
}

auto JobService::list_jobs_local(const ListJobsRequest &request)
    -> Result<std::vector<Job>> {
  auto jobs = store_.list_jobs();
  if (!jobs) {
    return jobs;
  }

  ankerl::unordered_dense::set<JobId> wanted(request.job_ids.begin(),
                                             request.job_ids.end());
  auto keep = [&](const Job &job) {
    if (!request.owner.empty() && job.owner != request.owner) {
      return false;
    }
    if (request.events_only && job.event_names.empty()) {
      return false;
    }
    if (request.timers_only && !job.has_schedule()) {
      return false;
    }
    return wanted.empty() || wanted.contains(job.id);
  };
  std::erase_if(*jobs, [&](const Job &job) { return !keep(job); });

  if (request.load_tasks) {
    for (auto &job : *jobs) {
      auto tasks = store_.list_tasks(job.id, *request.load_tasks);
      if (!tasks) {
        return fail(tasks.error());
      }
      auto page = *tasks | std::views::drop(request.tasks_offset);
      const auto limit = request.tasks_limit > 0 ? request.tasks_limit
                                                 : tasks->size();
      for (auto &t : page | std::views::take(limit)) {
        job.tasks.push_back(std::move(t));
      }
    }
  }
  return jobs;
}

auto JobService::put_task_local(Task task) -> Result<void> {
  if (supervisor_.is_live(task.id)) {
    log::warn("Task {} is driven by the supervisor, external write refused",
              task.id);
    return fail(Error::InvalidState);
  }
  auto job = store_.get_job(task.job_id);
  if (!job) {
    return fail(Error::NotFound);
  }
  auto snapshot = std::make_shared<const Job>(std::move(*job));
  Task published = task;
  if (auto r = store_.put_task(std::move(task)); !r) {
    return r;
  }
  publisher_.publish(
      TaskChangeEvent{.task = std::move(published), .job = std::move(snapshot)});
  return ok();
}

auto JobService::delete_tasks_local(const DeleteTasksRequest &request)
    -> Result<std::vector<TaskId>> {
  std::vector<TaskId> deleted;

  if (!request.task_ids.empty()) {
    for (const auto &id : request.task_ids) {
      if (supervisor_.is_live(id)) {
        log::warn("Task {} is live, not deleted", id);
        continue;
      }
      if (auto r = store_.delete_task(id); r) {
        deleted.push_back(id);
      }
    }
    return ok(std::move(deleted));
  }

  if (request.statuses.empty()) {
    return fail(Error::InvalidArgument);
  }

  auto candidates = store_.list_tasks(request.job_id, TaskStatus::Any);
  if (!candidates) {
    return fail(candidates.error());
  }
  std::erase_if(*candidates, [&](const Task &t) {
    return supervisor_.is_live(t.id) ||
           std::ranges::none_of(request.statuses, [&](TaskStatus s) {
             return status_matches(s, t.status);
           });
  });

  ankerl::unordered_dense::map<JobId, std::vector<Task>> by_job;
  for (auto &t : *candidates) {
    by_job[t.job_id].push_back(std::move(t));
  }
  for (auto &[job_id, tasks] : by_job) {
    std::ranges::sort(tasks, more_recent);
    for (auto &t : tasks | std::views::drop(request.prune_limit)) {
      if (auto r = store_.delete_task(t.id); r) {
        deleted.push_back(t.id);
      } else {
        log::warn("Failed to prune task {}: {}", t.id, r.error().message());
      }
    }
  }
  if (!deleted.empty()) {
    log::info("Pruned {} task(s)", deleted.size());
  }
  return ok(std::move(deleted));
}

auto JobService::trigger_local(const JobTriggerEvent &event)
    -> Result<std::optional<Task>> {
  auto job = store_.get_job(event.job_id);
  if (!job) {
    log::warn("Trigger for unknown job '{}'", event.job_id);
    return fail(Error::NotFound);
  }
  if (job->inactive && !event.run_now) {
    log::debug("Job '{}' is inactive, trigger skipped", event.job_id);
    return ok(std::optional<Task>{});
  }
  auto fired = supervisor_.fire_local(
      event.job_id,
      FireRequest{.trigger_owner = event.run_now ? "run_now" : "schedule"});
  if (!fired) {
    return fail(fired.error());
  }
  return ok(std::optional<Task>{std::move(*fired)});
}

auto JobService::dispatch_event_local(const std::string &event_name,
                                      const ActionMessage &message)
    -> Result<std::vector<TaskId>> {
  auto jobs = store_.list_jobs();
  if (!jobs) {
    return fail(jobs.error());
  }
  std::vector<TaskId> fired;
  for (const auto &job : *jobs) {
    if (job.inactive || !job.listens_to(event_name)) {
      continue;
    }
    auto t = supervisor_.fire_local(
        job.id, FireRequest{.trigger_owner = event_name, .initial = message});
    if (!t) {
      log::error("Event '{}' could not fire job '{}': {}", event_name, job.id,
                 t.error().message());
      continue;
    }
    fired.push_back(t->id);
  }
  log::debug("Event '{}' fired {} job(s)", event_name, fired.size());
  return ok(std::move(fired));
}

} // namespace jobforge

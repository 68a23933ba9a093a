#pragma once

#include "jobforge/job/job.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace jobforge {

/// Either `updated` is set or `removed` names the deleted job.
struct JobChangeEvent {
  std::shared_ptr<const Job> updated;
  JobId removed;
};

struct TaskChangeEvent {
  Task task;
  std::shared_ptr<const Job> job;
};

struct JobTriggerEvent {
  JobId job_id;
  std::optional<Schedule> schedule;
  bool run_now{false};
  std::chrono::system_clock::time_point fired_at{};
};

// Fan-out of change notifications. Subscribers are invoked synchronously on
// the publishing thread (the control shard), so they must not block.
class ChangePublisher {
public:
  using SubscriptionId = std::uint64_t;
  using JobListener = std::function<void(const JobChangeEvent &)>;
  using TaskListener = std::function<void(const TaskChangeEvent &)>;

  auto subscribe_jobs(JobListener fn) -> SubscriptionId {
    job_listeners_.emplace_back(++last_id_, std::move(fn));
    return last_id_;
  }

  auto subscribe_tasks(TaskListener fn) -> SubscriptionId {
    task_listeners_.emplace_back(++last_id_, std::move(fn));
    return last_id_;
  }

  auto unsubscribe(SubscriptionId id) -> void {
    std::erase_if(job_listeners_,
                  [id](const auto &entry) { return entry.first == id; });
    std::erase_if(task_listeners_,
                  [id](const auto &entry) { return entry.first == id; });
  }

  auto publish(const JobChangeEvent &event) const -> void {
    for (const auto &[id, fn] : job_listeners_) {
      fn(event);
    }
  }

  /// Dropped when the parent job asks for silent task updates.
  auto publish(const TaskChangeEvent &event) const -> void {
    if (event.job && event.job->tasks_silent_update) {
      return;
    }
    for (const auto &[id, fn] : task_listeners_) {
      fn(event);
    }
  }

private:
  SubscriptionId last_id_{0};
  std::vector<std::pair<SubscriptionId, JobListener>> job_listeners_;
  std::vector<std::pair<SubscriptionId, TaskListener>> task_listeners_;
};

} // namespace jobforge

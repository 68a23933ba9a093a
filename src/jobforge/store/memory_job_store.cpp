#include "jobforge/store/memory_job_store.hpp"

#include <algorithm>
#include <tuple>

namespace jobforge {

auto InMemoryJobStore::put_job(Job job) -> Result<void> {
  if (job.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  job.tasks.clear();
  auto id = job.id;
  jobs_.insert_or_assign(std::move(id), std::move(job));
  return ok();
}

auto InMemoryJobStore::get_job(const JobId &id) const -> Result<Job> {
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto InMemoryJobStore::delete_job(const JobId &id) -> Result<void> {
  if (jobs_.erase(id) == 0) {
    return fail(Error::NotFound);
  }
  if (auto it = tasks_by_job_.find(id); it != tasks_by_job_.end()) {
    for (const auto &task_id : it->second) {
      tasks_.erase(task_id);
    }
    tasks_by_job_.erase(it);
  }
  return ok();
}

auto InMemoryJobStore::list_jobs() const -> Result<std::vector<Job>> {
  std::vector<Job> out;
  out.reserve(jobs_.size());
  for (const auto &[id, job] : jobs_) {
    out.push_back(job);
  }
  std::ranges::sort(out, {}, [](const Job &j) { return j.id; });
  return ok(std::move(out));
}

auto InMemoryJobStore::put_task(Task task) -> Result<void> {
  if (task.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (!jobs_.contains(task.job_id)) {
    return fail(Error::NotFound);
  }
  tasks_by_job_[task.job_id].insert(task.id);
  auto id = task.id;
  tasks_.insert_or_assign(std::move(id), std::move(task));
  return ok();
}

auto InMemoryJobStore::get_task(const TaskId &id) const -> Result<Task> {
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto InMemoryJobStore::list_tasks(const JobId &job_id, TaskStatus status) const
    -> Result<std::vector<Task>> {
  std::vector<Task> out;
  auto collect = [&](const Task &task) {
    if (status_matches(status, task.status)) {
      out.push_back(task);
    }
  };

  if (job_id.empty()) {
    for (const auto &[id, task] : tasks_) {
      collect(task);
    }
  } else if (auto it = tasks_by_job_.find(job_id); it != tasks_by_job_.end()) {
    for (const auto &task_id : it->second) {
      if (auto t = tasks_.find(task_id); t != tasks_.end()) {
        collect(t->second);
      }
    }
  }

  std::ranges::sort(out, [](const Task &a, const Task &b) {
    return std::tie(a.start_time, a.id) < std::tie(b.start_time, b.id);
  });
  return ok(std::move(out));
}

auto InMemoryJobStore::delete_task(const TaskId &id) -> Result<void> {
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return fail(Error::NotFound);
  }
  if (auto by_job = tasks_by_job_.find(it->second.job_id);
      by_job != tasks_by_job_.end()) {
    by_job->second.erase(id);
  }
  tasks_.erase(it);
  return ok();
}

} // namespace jobforge

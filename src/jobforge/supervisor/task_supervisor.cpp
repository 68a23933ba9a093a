#include "jobforge/supervisor/task_supervisor.hpp"

#include "jobforge/util/log.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace jobforge {

namespace {

constexpr std::size_t kUpdateCapacity = 1024;

[[nodiscard]] auto now() -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::now();
}

} // namespace

TaskSupervisor::TaskSupervisor(Runtime &runtime, JobStore &store,
                               ActionChainExecutor &executor,
                               ChangePublisher &publisher,
                               SupervisorOptions options)
    : runtime_(runtime), store_(store), executor_(executor),
      publisher_(publisher), options_(std::move(options)),
      updates_(std::make_unique<UpdateChannel>(
          runtime.executor_for(kControlShard), kUpdateCapacity)) {}

TaskSupervisor::~TaskSupervisor() { stop(); }

auto TaskSupervisor::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  co_spawn(runtime_.executor_for(kControlShard), consume_updates(), detached);
  log::info("Task supervisor started (default max concurrency {})",
            options_.default_max_concurrency);
}

auto TaskSupervisor::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  auto stop_all = [this] {
    for (auto &[id, live] : live_) {
      live.control->stop();
    }
  };
  if (runtime_.is_running() && runtime_.current_shard() != kControlShard) {
    runtime_.sync_wait(runtime_.invoke_on(kControlShard, stop_all));
  } else {
    stop_all();
  }
  updates_->close();
  log::info("Task supervisor stopped");
}

auto TaskSupervisor::set_on_job_removed(
    std::move_only_function<void(const JobId &)> cb) -> void {
  on_job_removed_ = std::move(cb);
}

auto TaskSupervisor::fire(JobId job_id, FireRequest request)
    -> task<Result<Task>> {
  co_return co_await runtime_.invoke_on(
      kControlShard,
      [this, job_id = std::move(job_id), request = std::move(request)]() mutable {
        return fire_local(job_id, std::move(request));
      });
}

auto TaskSupervisor::control(CtrlCommand cmd)
    -> task<Result<CtrlCommandResponse>> {
  co_return co_await runtime_.invoke_on(
      kControlShard,
      [this, cmd = std::move(cmd)] { return control_local(cmd); });
}

auto TaskSupervisor::consume_updates() -> spawn_task {
  while (true) {
    auto [ec, update] = co_await updates_->async_receive(use_nothrow);
    if (ec) {
      break;
    }
    std::visit([this](auto &&u) { handle(std::move(u)); }, std::move(update));
  }
  log::debug("Supervisor update loop exited");
}

auto TaskSupervisor::send(Update update) -> task<void> {
  auto [ec] = co_await updates_->async_send(boost::system::error_code{},
                                            std::move(update), use_nothrow);
  if (ec) {
    log::debug("Supervisor channel closed, update dropped");
  }
}

auto TaskSupervisor::run_chain(std::shared_ptr<const Job> job, TaskId task_id,
                               std::shared_ptr<TaskControl> control,
                               ActionMessage initial) -> spawn_task {
  ChainRunContext ctx{
      .job_id = job->id,
      .task_id = task_id,
      .control = std::move(control),
      .callbacks = {
          .on_log = [this, task_id](ActionLog entry) -> task<void> {
            co_await send(
                ActionLogged{.task_id = task_id, .log = std::move(entry)});
          },
          .on_progress = [this, task_id](std::size_t completed,
                                         std::size_t planned) -> task<void> {
            co_await send(ProgressMade{.task_id = task_id,
                                       .completed = completed,
                                       .planned = planned});
          }}};

  ChainResult result;
  try {
    result = co_await executor_.run(job->actions, std::move(initial),
                                    std::move(ctx));
  } catch (const std::exception &e) {
    log::error("Task {} chain aborted: {}", task_id, e.what());
    result.status = TaskStatus::Error;
    result.status_message = std::format("chain aborted: {}", e.what());
  } catch (...) {
    log::error("Task {} chain aborted by a non-standard exception", task_id);
    result.status = TaskStatus::Error;
    result.status_message = "chain aborted: unknown exception";
  }
  co_await send(
      ChainFinished{.task_id = task_id, .result = std::move(result)});
}

auto TaskSupervisor::handle(ActionLogged &&u) -> void {
  auto it = live_.find(u.task_id);
  if (it == live_.end()) {
    log::debug("Log for settled task {} dropped", u.task_id);
    return;
  }
  auto &live = it->second;
  live.task.action_logs.push_back(std::move(u.log));
  live.task.last_update = now();
  persist(live);
}

auto TaskSupervisor::handle(ProgressMade &&u) -> void {
  auto it = live_.find(u.task_id);
  if (it == live_.end()) {
    return;
  }
  auto &live = it->second;
  if (!live.task.has_progress) {
    return;
  }
  if (u.planned > 0) {
    live.task.progress = std::min(
        1.0F, static_cast<float>(u.completed) / static_cast<float>(u.planned));
  }
  live.task.last_update = now();
  persist(live);
}

auto TaskSupervisor::handle(ChainFinished &&u) -> void {
  auto it = live_.find(u.task_id);
  if (it == live_.end()) {
    log::debug("Late completion of task {} ignored", u.task_id);
    return;
  }
  auto status = u.result.status;
  if (it->second.control->stop_requested() && status == TaskStatus::Finished) {
    status = TaskStatus::Interrupted;
  }
  settle(u.task_id, status, std::move(u.result.status_message),
         u.result.progress());
}

auto TaskSupervisor::persist(const Task &task,
                             const std::shared_ptr<const Job> &job) -> void {
  if (auto r = store_.put_task(task); !r) {
    log::warn("Failed to persist task {}: {}", task.id, r.error().message());
  }
  if (job && job->tasks_silent_update) {
    return;
  }
  publisher_.publish(TaskChangeEvent{.task = task, .job = job});
}

auto TaskSupervisor::persist(const LiveTask &live) -> void {
  persist(live.task, live.job);
}

auto TaskSupervisor::effective_limit(const Job &job) const noexcept -> int {
  return job.max_concurrency > 0 ? job.max_concurrency
                                 : options_.default_max_concurrency;
}

auto TaskSupervisor::start_task(LiveTask &live) -> void {
  live.holds_slot = true;
  ++slots_[live.task.job_id].running;

  live.task.status = TaskStatus::Running;
  live.task.status_message = "running";
  live.task.start_time = now();
  live.task.last_update = live.task.start_time;
  persist(live);

  live.shard = runtime_.next_worker_shard();
  log::info("Task {} of job {} started on shard {}", live.task.id,
            live.task.job_id, live.shard);
  runtime_.spawn_on(live.shard, run_chain(live.job, live.task.id, live.control,
                                          std::exchange(live.initial, {})));
}

auto TaskSupervisor::release_slot(LiveTask &live) -> void {
  if (!live.holds_slot) {
    return;
  }
  live.holds_slot = false;
  auto &slots = slots_[live.task.job_id];
  if (slots.running > 0) {
    --slots.running;
  }
}

auto TaskSupervisor::promote(const JobId &job_id) -> void {
  auto sit = slots_.find(job_id);
  if (sit == slots_.end()) {
    return;
  }
  auto &slots = sit->second;
  if (slots.queue.empty()) {
    return;
  }

  auto job = store_.get_job(job_id);
  if (!job) {
    log::warn("Job {} vanished, dropping {} queued task(s)", job_id,
              slots.queue.size());
    auto queued = std::exchange(slots.queue, {});
    for (const auto &id : queued) {
      settle(id, TaskStatus::Interrupted, "job removed before start", 0.0F);
    }
    return;
  }

  const int limit = effective_limit(*job);
  while (!slots.queue.empty() && (limit <= 0 || slots.running < limit)) {
    auto id = slots.queue.front();
    slots.queue.pop_front();
    auto lit = live_.find(id);
    if (lit == live_.end() || lit->second.task.status != TaskStatus::Queued) {
      continue;
    }
    start_task(lit->second);
  }
}

auto TaskSupervisor::settle(const TaskId &task_id, TaskStatus status,
                            std::string message, float progress) -> void {
  auto it = live_.find(task_id);
  if (it == live_.end()) {
    return;
  }
  auto &live = it->second;
  const auto job_id = live.task.job_id;
  const auto job = live.job;

  if (live.task.status == TaskStatus::Queued) {
    if (auto sit = slots_.find(job_id); sit != slots_.end()) {
      std::erase(sit->second.queue, task_id);
    }
  }
  release_slot(live);

  live.task.status = status;
  live.task.status_message = std::move(message);
  live.task.end_time = now();
  live.task.last_update = live.task.end_time;
  live.task.progress = progress;
  live.task.can_stop = false;
  live.task.can_pause = false;
  persist(live);
  log::info("Task {} of job {} ended {}: {}", task_id, job_id,
            to_string_view(status), live.task.status_message);
  live_.erase(it);

  promote(job_id);

  if (status == TaskStatus::Finished && job && job->auto_clean) {
    if (auto r = store_.delete_job(job_id); r) {
      log::info("Job {} removed after a successful run (auto_clean)", job_id);
      publisher_.publish(JobChangeEvent{.removed = job_id});
      if (on_job_removed_) {
        on_job_removed_(job_id);
      }
    }
  }
}

auto TaskSupervisor::fire_local(const JobId &job_id, FireRequest request)
    -> Result<Task> {
  auto job = store_.get_job(job_id);
  if (!job) {
    log::warn("Cannot fire unknown job {}", job_id);
    return fail(Error::NotFound);
  }
  auto job_ptr = std::make_shared<const Job>(std::move(*job));

  const auto fired_at = now();
  const auto caps = executor_.capabilities_of(job_ptr->actions);
  Task task{.id = generate_task_id(),
            .job_id = job_id,
            .status = TaskStatus::Queued,
            .status_message = "queued",
            .trigger_owner = std::move(request.trigger_owner),
            .start_time = fired_at,
            .can_stop = caps.can_stop,
            .can_pause = caps.can_pause,
            .has_progress = caps.has_progress,
            .last_update = fired_at};
  const auto task_id = task.id;

  auto [it, inserted] = live_.emplace(
      task_id, LiveTask{.task = std::move(task),
                        .job = job_ptr,
                        .control = std::make_shared<TaskControl>(),
                        .initial = std::move(request.initial)});
  if (!inserted) {
    return fail(Error::AlreadyExists);
  }

  auto &slots = slots_[job_id];
  const int limit = effective_limit(*job_ptr);
  if (limit <= 0 || slots.running < limit) {
    start_task(it->second);
  } else {
    slots.queue.push_back(task_id);
    persist(it->second);
    log::info("Task {} of job {} queued ({} of {} slots busy, {} waiting)",
              task_id, job_id, slots.running, limit, slots.queue.size());
  }
  return ok(it->second.task);
}

auto TaskSupervisor::force_interrupt(const TaskId &task_id, std::string reason)
    -> bool {
  auto it = live_.find(task_id);
  if (it == live_.end() || it->second.task.status != TaskStatus::Running) {
    return false;
  }
  it->second.control->stop();
  const auto progress = it->second.task.progress;
  settle(task_id, TaskStatus::Interrupted, std::move(reason), progress);
  return true;
}

auto TaskSupervisor::live_tasks() const -> std::vector<LiveTaskInfo> {
  std::vector<LiveTaskInfo> out;
  out.reserve(live_.size());
  for (const auto &[id, live] : live_) {
    out.push_back(LiveTaskInfo{.id = id,
                               .job_id = live.task.job_id,
                               .status = live.task.status,
                               .last_update = live.task.last_update,
                               .holds_slot = live.holds_slot});
  }
  return out;
}

auto TaskSupervisor::running_count(const JobId &job_id) const -> int {
  auto it = slots_.find(job_id);
  return it != slots_.end() ? it->second.running : 0;
}

auto TaskSupervisor::queued_count(const JobId &job_id) const -> std::size_t {
  auto it = slots_.find(job_id);
  return it != slots_.end() ? it->second.queue.size() : 0;
}

auto TaskSupervisor::stop_job_tasks(const JobId &job_id,
                                    std::string_view reason) -> std::size_t {
  // Queued tasks first so that no freed slot promotes one of them.
  std::vector<TaskId> ids;
  for (const auto &[id, live] : live_) {
    if (live.task.job_id == job_id && live.task.status == TaskStatus::Queued) {
      ids.push_back(id);
    }
  }
  for (const auto &[id, live] : live_) {
    if (live.task.job_id == job_id && live.task.status != TaskStatus::Queued) {
      ids.push_back(id);
    }
  }
  for (const auto &id : ids) {
    auto it = live_.find(id);
    if (it == live_.end()) {
      continue;
    }
    it->second.control->stop();
    const auto progress = it->second.task.progress;
    settle(id, TaskStatus::Interrupted, std::string(reason), progress);
  }
  return ids.size();
}

auto TaskSupervisor::interrupt_orphan(const TaskId &task_id,
                                      std::string reason) -> Result<void> {
  if (live_.contains(task_id)) {
    return fail(Error::InvalidState);
  }
  auto task = store_.get_task(task_id);
  if (!task) {
    return fail(task.error());
  }
  if (task->status != TaskStatus::Running &&
      task->status != TaskStatus::Paused &&
      task->status != TaskStatus::Queued) {
    return fail(Error::InvalidState);
  }

  std::shared_ptr<const Job> job;
  if (auto stored = store_.get_job(task->job_id); stored) {
    job = std::make_shared<const Job>(std::move(*stored));
  }
  task->status = TaskStatus::Interrupted;
  task->status_message = std::move(reason);
  task->end_time = now();
  task->last_update = task->end_time;
  task->can_stop = false;
  task->can_pause = false;
  persist(*task, job);
  log::warn("Orphaned task {} of job {} marked interrupted: {}", task_id,
            task->job_id, task->status_message);
  return ok();
}

auto TaskSupervisor::control_local(const CtrlCommand &cmd)
    -> Result<CtrlCommandResponse> {
  if (cmd.cmd == Command::None) {
    log::warn("Control command without an action ignored");
    return fail(Error::NotFound);
  }

  auto job_id = cmd.job_id;
  if (job_id.empty() && !cmd.task_id.empty()) {
    auto task = store_.get_task(cmd.task_id);
    if (!task) {
      return fail(Error::NotFound);
    }
    job_id = task->job_id;
  }
  auto job = store_.get_job(job_id);
  if (!job) {
    return fail(Error::NotFound);
  }
  if (options_.authorizer && !options_.authorizer(cmd, *job)) {
    log::warn("Command {} on job {} denied for '{}'", to_string_view(cmd.cmd),
              job_id, cmd.owner_id);
    return fail(Error::PermissionDenied);
  }

  switch (cmd.cmd) {
  case Command::Inactive:
    return set_inactive(std::move(*job), true);
  case Command::Active:
    return set_inactive(std::move(*job), false);
  case Command::RunOnce: {
    auto task = fire_local(job_id, FireRequest{.trigger_owner = cmd.owner_id});
    if (!task) {
      return fail(task.error());
    }
    return ok(CtrlCommandResponse{
        .msg = std::format("task {} {}", task->id, to_string_view(task->status))});
  }
  default:
    break;
  }

  auto targets = targets_for(cmd, *job);
  if (!targets) {
    return fail(targets.error());
  }
  std::size_t applied = 0;
  std::error_code first_error;
  for (const auto &id : *targets) {
    if (auto r = apply(cmd.cmd, id); r) {
      ++applied;
    } else if (!first_error) {
      first_error = r.error();
    }
  }
  if (applied == 0) {
    return fail(first_error ? first_error : make_error_code(Error::InvalidState));
  }
  return ok(CtrlCommandResponse{.msg = std::format(
                                    "{} applied to {} task(s)",
                                    to_string_view(cmd.cmd), applied)});
}

auto TaskSupervisor::targets_for(const CtrlCommand &cmd, const Job &job)
    -> Result<std::vector<TaskId>> {
  if (!cmd.task_id.empty()) {
    if (auto it = live_.find(cmd.task_id); it != live_.end()) {
      if (it->second.task.job_id != job.id) {
        return fail(Error::NotFound);
      }
      return ok(std::vector<TaskId>{cmd.task_id});
    }
    auto stored = store_.get_task(cmd.task_id);
    if (!stored || stored->job_id != job.id) {
      return fail(Error::NotFound);
    }
    return ok(std::vector<TaskId>{cmd.task_id});
  }

  auto eligible = [&](const Task &t) {
    switch (cmd.cmd) {
    case Command::Pause:
      return t.status == TaskStatus::Running && t.can_pause;
    case Command::Resume:
      return t.status == TaskStatus::Paused;
    case Command::Stop:
    case Command::Delete:
      return t.status == TaskStatus::Queued ||
             (occupies_slot(t.status) && t.can_stop);
    default:
      return false;
    }
  };

  std::vector<TaskId> out;
  for (const auto &[id, live] : live_) {
    if (live.task.job_id == job.id && eligible(live.task)) {
      out.push_back(id);
    }
  }
  if (out.empty()) {
    return fail(Error::InvalidState);
  }
  return ok(std::move(out));
}

auto TaskSupervisor::apply(Command cmd, const TaskId &task_id)
    -> Result<void> {
  switch (cmd) {
  case Command::Pause:
    return pause_task(task_id);
  case Command::Resume:
    return resume_task(task_id);
  case Command::Stop:
    return stop_task(task_id);
  case Command::Delete:
    return delete_task(task_id);
  default:
    return fail(Error::InvalidArgument);
  }
}

auto TaskSupervisor::pause_task(const TaskId &task_id) -> Result<void> {
  auto it = live_.find(task_id);
  if (it == live_.end()) {
    return store_.get_task(task_id).and_then(
        [](const Task &) -> Result<void> { return fail(Error::InvalidState); });
  }
  auto &live = it->second;
  if (live.task.status != TaskStatus::Running || !live.task.can_pause ||
      !live.control->pause()) {
    return fail(Error::InvalidState);
  }
  live.task.status = TaskStatus::Paused;
  live.task.status_message = "paused";
  live.task.last_update = now();
  persist(live);
  log::info("Task {} paused", task_id);
  return ok();
}

auto TaskSupervisor::resume_task(const TaskId &task_id) -> Result<void> {
  auto it = live_.find(task_id);
  if (it == live_.end()) {
    return store_.get_task(task_id).and_then(
        [](const Task &) -> Result<void> { return fail(Error::InvalidState); });
  }
  auto &live = it->second;
  if (live.task.status != TaskStatus::Paused || !live.control->resume()) {
    return fail(Error::InvalidState);
  }
  live.task.status = TaskStatus::Running;
  live.task.status_message = "running";
  live.task.last_update = now();
  persist(live);
  log::info("Task {} resumed", task_id);
  return ok();
}

auto TaskSupervisor::stop_task(const TaskId &task_id) -> Result<void> {
  auto it = live_.find(task_id);
  if (it == live_.end()) {
    return interrupt_orphan(task_id, "stopped by request");
  }
  auto &live = it->second;
  switch (live.task.status) {
  case TaskStatus::Queued:
    settle(task_id, TaskStatus::Interrupted, "stopped before start", 0.0F);
    return ok();
  case TaskStatus::Running:
  case TaskStatus::Paused: {
    if (!live.task.can_stop) {
      return fail(Error::InvalidState);
    }
    live.control->stop();
    const auto progress = live.task.progress;
    settle(task_id, TaskStatus::Interrupted, "stopped by request", progress);
    return ok();
  }
  default:
    return fail(Error::InvalidState);
  }
}

auto TaskSupervisor::delete_task(const TaskId &task_id) -> Result<void> {
  if (auto it = live_.find(task_id); it != live_.end()) {
    if (auto r = stop_task(task_id); !r) {
      return r;
    }
  }
  auto stored = store_.get_task(task_id);
  if (!stored) {
    return fail(stored.error());
  }
  if (stored->status == TaskStatus::Running ||
      stored->status == TaskStatus::Paused) {
    if (auto r = interrupt_orphan(task_id, "stopped for deletion"); !r) {
      return r;
    }
  }
  if (auto r = store_.delete_task(task_id); !r) {
    return r;
  }
  log::info("Task {} of job {} deleted", task_id, stored->job_id);
  return ok();
}

auto TaskSupervisor::set_inactive(Job job, bool inactive)
    -> Result<CtrlCommandResponse> {
  const auto job_id = job.id;
  if (job.inactive == inactive) {
    return ok(CtrlCommandResponse{
        .msg = std::format("job {} already {}", job_id,
                           inactive ? "inactive" : "active")});
  }
  job.inactive = inactive;
  auto snapshot = std::make_shared<const Job>(job);
  if (auto r = store_.put_job(std::move(job)); !r) {
    return fail(r.error());
  }
  publisher_.publish(JobChangeEvent{.updated = std::move(snapshot)});
  log::info("Job {} marked {}", job_id, inactive ? "inactive" : "active");
  return ok(CtrlCommandResponse{
      .msg = std::format("job {} {}", job_id, inactive ? "inactive" : "active")});
}

} // namespace jobforge

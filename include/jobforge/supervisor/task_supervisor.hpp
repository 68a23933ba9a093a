#pragma once

#include "jobforge/action/chain_executor.hpp"
#include "jobforge/action/task_control.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/core/runtime.hpp"
#include "jobforge/job/command.hpp"
#include "jobforge/job/events.hpp"
#include "jobforge/job/job.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/store/job_store.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jobforge {

struct SupervisorOptions {
  /// Used when a job's own limit is <= 0. 0 = unbounded.
  int default_max_concurrency{0};
  /// Returns false to deny a command. Unset = allow everything.
  std::function<bool(const CtrlCommand &, const Job &)> authorizer;
};

struct FireRequest {
  std::string trigger_owner;
  ActionMessage initial;
};

/// Read-only view of a task the supervisor is driving.
struct LiveTaskInfo {
  TaskId id;
  JobId job_id;
  TaskStatus status{TaskStatus::Unknown};
  std::chrono::system_clock::time_point last_update{};
  bool holds_slot{false};
};

// Owns the lifecycle of every live task. State is confined to the control
// shard: the *_local members must run there, the awaitable members hop to it.
// Chains run on worker shards and report back through a channel.
class TaskSupervisor {
public:
  TaskSupervisor(Runtime &runtime, JobStore &store,
                 ActionChainExecutor &executor, ChangePublisher &publisher,
                 SupervisorOptions options = {});
  ~TaskSupervisor();

  TaskSupervisor(const TaskSupervisor &) = delete;
  auto operator=(const TaskSupervisor &) -> TaskSupervisor & = delete;

  auto start() -> void;
  /// Requests every live chain to stop and closes the update channel.
  auto stop() -> void;

  /// Invoked on the control shard after a job was removed by auto_clean.
  auto set_on_job_removed(std::move_only_function<void(const JobId &)> cb)
      -> void;

  [[nodiscard]] auto fire(JobId job_id, FireRequest request)
      -> task<Result<Task>>;
  [[nodiscard]] auto control(CtrlCommand cmd)
      -> task<Result<CtrlCommandResponse>>;

  // Control shard only.
  [[nodiscard]] auto fire_local(const JobId &job_id, FireRequest request)
      -> Result<Task>;
  [[nodiscard]] auto control_local(const CtrlCommand &cmd)
      -> Result<CtrlCommandResponse>;
  /// Moves a running task to Interrupted and releases its slot. False when
  /// the task is not live or already settled.
  auto force_interrupt(const TaskId &task_id, std::string reason) -> bool;
  /// Interrupts every queued, running or paused task of a job. Returns how
  /// many were stopped.
  auto stop_job_tasks(const JobId &job_id, std::string_view reason)
      -> std::size_t;
  /// Marks a stored Running/Paused/Queued record that no live task backs
  /// (left over from a crash or a lost chain) as Interrupted.
  [[nodiscard]] auto interrupt_orphan(const TaskId &task_id,
                                      std::string reason) -> Result<void>;
  [[nodiscard]] auto live_tasks() const -> std::vector<LiveTaskInfo>;
  [[nodiscard]] auto is_live(const TaskId &task_id) const -> bool {
    return live_.contains(task_id);
  }
  [[nodiscard]] auto running_count(const JobId &job_id) const -> int;
  [[nodiscard]] auto queued_count(const JobId &job_id) const -> std::size_t;
  [[nodiscard]] auto effective_limit(const Job &job) const noexcept -> int;

private:
  struct ActionLogged {
    TaskId task_id;
    ActionLog log;
  };
  struct ProgressMade {
    TaskId task_id;
    std::size_t completed{0};
    std::size_t planned{0};
  };
  struct ChainFinished {
    TaskId task_id;
    ChainResult result;
  };
  using Update = std::variant<ActionLogged, ProgressMade, ChainFinished>;
  using UpdateChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Update)>;

  struct LiveTask {
    Task task;
    std::shared_ptr<const Job> job;
    std::shared_ptr<TaskControl> control;
    ActionMessage initial;
    bool holds_slot{false};
    shard_id shard{kInvalidShard};
  };

  struct JobSlots {
    int running{0};
    std::deque<TaskId> queue;
  };

  auto consume_updates() -> spawn_task;
  auto run_chain(std::shared_ptr<const Job> job, TaskId task_id,
                 std::shared_ptr<TaskControl> control, ActionMessage initial)
      -> spawn_task;
  auto send(Update update) -> task<void>;

  auto handle(ActionLogged &&u) -> void;
  auto handle(ProgressMade &&u) -> void;
  auto handle(ChainFinished &&u) -> void;

  auto start_task(LiveTask &live) -> void;
  auto release_slot(LiveTask &live) -> void;
  auto promote(const JobId &job_id) -> void;
  /// Terminal transition: persist, publish and forget the live entry.
  auto settle(const TaskId &task_id, TaskStatus status, std::string message,
              float progress) -> void;
  auto persist(const LiveTask &live) -> void;
  auto persist(const Task &task, const std::shared_ptr<const Job> &job)
      -> void;

  [[nodiscard]] auto targets_for(const CtrlCommand &cmd, const Job &job)
      -> Result<std::vector<TaskId>>;
  [[nodiscard]] auto apply(Command cmd, const TaskId &task_id)
      -> Result<void>;
  [[nodiscard]] auto pause_task(const TaskId &task_id) -> Result<void>;
  [[nodiscard]] auto resume_task(const TaskId &task_id) -> Result<void>;
  [[nodiscard]] auto stop_task(const TaskId &task_id) -> Result<void>;
  [[nodiscard]] auto delete_task(const TaskId &task_id) -> Result<void>;
  [[nodiscard]] auto set_inactive(Job job, bool inactive)
      -> Result<CtrlCommandResponse>;

  Runtime &runtime_;
  JobStore &store_;
  ActionChainExecutor &executor_;
  ChangePublisher &publisher_;
  SupervisorOptions options_;
  std::move_only_function<void(const JobId &)> on_job_removed_;

  std::atomic<bool> running_{false};
  std::unique_ptr<UpdateChannel> updates_;

  // Accessed only on the control shard
  ankerl::unordered_dense::map<TaskId, LiveTask> live_;
  ankerl::unordered_dense::map<JobId, JobSlots> slots_;
};

} // namespace jobforge

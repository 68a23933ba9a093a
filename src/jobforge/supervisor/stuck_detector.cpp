#include "jobforge/supervisor/stuck_detector.hpp"

#include "jobforge/core/runtime.hpp"
#include "jobforge/store/job_store.hpp"
#include "jobforge/supervisor/task_supervisor.hpp"
#include "jobforge/util/log.hpp"
#include "jobforge/util/time.hpp"

#include <format>

namespace jobforge {

StuckTaskDetector::StuckTaskDetector(Runtime &runtime,
                                     TaskSupervisor &supervisor,
                                     JobStore &store)
    : runtime_(runtime), supervisor_(supervisor), store_(store) {}

auto StuckTaskDetector::sweep(TimePoint since)
    -> task<Result<std::vector<TaskId>>> {
  co_return co_await runtime_.invoke_on(
      kControlShard, [this, since] { return sweep_local(since); });
}

auto StuckTaskDetector::sweep_local(TimePoint since)
    -> Result<std::vector<TaskId>> {
  const auto reason =
      std::format("no update since {}", util::format_iso8601(since));
  std::vector<TaskId> interrupted;

  for (const auto &info : supervisor_.live_tasks()) {
    if (info.status != TaskStatus::Running || info.last_update >= since) {
      continue;
    }
    if (supervisor_.force_interrupt(info.id, reason)) {
      interrupted.push_back(info.id);
    }
  }

  auto stored = store_.list_tasks(JobId{}, TaskStatus::Running);
  if (!stored) {
    return fail(stored.error());
  }
  for (const auto &t : *stored) {
    if (supervisor_.is_live(t.id) || t.last_update >= since) {
      continue;
    }
    if (auto r = supervisor_.interrupt_orphan(t.id, reason); r) {
      interrupted.push_back(t.id);
    } else {
      log::warn("Could not repair stuck task {}: {}", t.id,
                r.error().message());
    }
  }

  if (!interrupted.empty()) {
    log::warn("Interrupted {} stuck task(s) ({})", interrupted.size(), reason);
  }
  return ok(std::move(interrupted));
}

} // namespace jobforge

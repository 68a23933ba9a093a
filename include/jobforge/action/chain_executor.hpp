#pragma once

#include "jobforge/action/handler.hpp"
#include "jobforge/action/task_control.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/job/action.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/selector/resolver.hpp"
#include "jobforge/util/id.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace jobforge {

struct ChainCallbacks {
  std::move_only_function<task<void>(ActionLog)> on_log;
  std::move_only_function<task<void>(std::size_t completed,
                                     std::size_t planned)>
      on_progress;
};

struct ChainRunContext {
  JobId job_id;
  TaskId task_id;
  std::shared_ptr<TaskControl> control;
  ChainCallbacks callbacks;
};

struct ChainResult {
  TaskStatus status{TaskStatus::Finished};
  std::string status_message;
  /// Message produced by the last leaf action to complete.
  ActionMessage final_message;
  std::vector<ActionLog> logs;
  std::size_t completed{0};
  std::size_t planned{0};

  [[nodiscard]] auto progress() const noexcept -> float {
    if (status == TaskStatus::Finished || planned == 0) {
      return status == TaskStatus::Finished ? 1.0F : 0.0F;
    }
    return static_cast<float>(completed) / static_cast<float>(planned);
  }
};

// Runs an action tree for one task. All branches of a run share the calling
// coroutine's executor and interleave cooperatively; chained siblings and
// per-entity invocations fan out concurrently.
class ActionChainExecutor {
public:
  ActionChainExecutor(SelectorResolver &resolver, const ActionRegistry &registry)
      : resolver_(resolver), registry_(registry) {}

  [[nodiscard]] auto capabilities_of(const ActionTree &tree) const
      -> HandlerCapabilities {
    return registry_.capabilities_of(tree);
  }

  [[nodiscard]] auto run(const ActionTree &tree, ActionMessage initial,
                         ChainRunContext ctx) -> task<ChainResult>;

private:
  struct RunState;

  auto run_action(RunState &state, ActionIndex idx, ActionMessage input,
                  std::string branch) -> task<void>;
  auto run_invocation(RunState &state, ActionIndex idx, IActionHandler &handler,
                      ActionMessage input, std::string branch) -> task<void>;
  auto run_children(RunState &state, ActionIndex idx, ActionMessage input,
                    const std::string &branch) -> task<void>;
  auto record(RunState &state, ActionIndex idx, std::string branch,
              ActionMessage input, ActionMessage output) -> task<void>;

  SelectorResolver &resolver_;
  const ActionRegistry &registry_;
};

} // namespace jobforge

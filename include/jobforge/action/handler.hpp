#pragma once

#include "jobforge/action/task_control.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/action.hpp"
#include "jobforge/job/task.hpp"
#include "jobforge/util/id.hpp"

#include <flat_map>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

struct ActionContext {
  const Action &action;
  JobId job_id;
  TaskId task_id;
  std::string_view branch;
  const TaskControl &control;
};

/// What a running invocation of a handler tolerates. A task inherits the
/// intersection over every handler its action tree names.
struct HandlerCapabilities {
  bool can_stop{true};
  /// Pausing only holds the chain at the next checkpoint; handlers whose
  /// work cannot be held mid-flight clear this.
  bool can_pause{true};
  /// The handler reports meaningful partial progress.
  bool has_progress{false};
};

class IActionHandler {
public:
  virtual ~IActionHandler() = default;

  [[nodiscard]] virtual auto capabilities() const -> HandlerCapabilities {
    return {};
  }

  /// Returns `input` with exactly one ActionOutput appended. An error result
  /// is recorded as a failed output by the executor.
  [[nodiscard]] virtual auto run(const ActionContext &ctx, ActionMessage input)
      -> task<Result<ActionMessage>> = 0;
};

// Adapts a callable to IActionHandler.
class FunctionHandler final : public IActionHandler {
public:
  using Fn = std::move_only_function<task<Result<ActionMessage>>(
      const ActionContext &, ActionMessage)>;

  explicit FunctionHandler(Fn fn, HandlerCapabilities caps = {})
      : fn_(std::move(fn)), caps_(caps) {}

  [[nodiscard]] auto capabilities() const -> HandlerCapabilities override {
    return caps_;
  }

  [[nodiscard]] auto run(const ActionContext &ctx, ActionMessage input)
      -> task<Result<ActionMessage>> override {
    return fn_(ctx, std::move(input));
  }

private:
  Fn fn_;
  HandlerCapabilities caps_;
};

class ActionRegistry {
public:
  /// Replaces any handler already registered under `id`.
  auto register_handler(std::string id, std::shared_ptr<IActionHandler> handler)
      -> void;
  auto register_function(std::string id, FunctionHandler::Fn fn,
                         HandlerCapabilities caps = {}) -> void;

  [[nodiscard]] auto find(std::string_view id) const -> IActionHandler *;
  [[nodiscard]] auto contains(std::string_view id) const -> bool {
    return find(id) != nullptr;
  }
  [[nodiscard]] auto ids() const -> std::vector<std::string>;
  /// Intersection of stop/pause support over the handlers `tree` names;
  /// progress is reported when any of them has it or the tree chains more
  /// than one action. Unregistered ids fail at once and are skipped.
  [[nodiscard]] auto capabilities_of(const ActionTree &tree) const
      -> HandlerCapabilities;

private:
  std::flat_map<std::string, std::shared_ptr<IActionHandler>, std::less<>>
      handlers_;
};

/// Registers `log`, `sleep` and `shell`.
auto register_builtin_actions(ActionRegistry &registry) -> void;

} // namespace jobforge

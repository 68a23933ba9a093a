#include "jobforge/action/chain_executor.hpp"

#include "jobforge/util/log.hpp"

#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <ranges>
#include <string>
#include <utility>

namespace jobforge {

struct ActionChainExecutor::RunState {
  const ActionTree &tree;
  ChainRunContext ctx;
  std::size_t completed{0};
  std::size_t planned{0};
  bool failed{false};
  std::string first_error;
  std::vector<ActionLog> logs;
  ActionMessage final_message;

  /// Drop `n` planned invocations that will not run.
  auto cut(std::size_t n) noexcept -> void {
    planned = planned > n ? planned - n : 0;
    planned = std::max(planned, completed);
  }

  auto fail(std::string error) -> void {
    log::warn("Task {}: {}", ctx.task_id, error);
    if (!failed) {
      failed = true;
      first_error = std::move(error);
    }
  }

  [[nodiscard]] auto checkpoint() const -> task<bool> {
    if (!ctx.control) {
      co_return true;
    }
    co_return co_await ctx.control->checkpoint();
  }

  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return ctx.control && ctx.control->stop_requested();
  }
};

namespace {

using BranchOp = decltype(co_spawn(std::declval<boost::asio::any_io_executor>(),
                                   std::declval<task<void>>(),
                                   boost::asio::deferred));

// Runs every branch to completion and reports the exceptions that escaped.
[[nodiscard]] auto run_all(std::vector<task<void>> branches)
    -> task<std::vector<std::exception_ptr>> {
  if (branches.empty()) {
    co_return std::vector<std::exception_ptr>{};
  }
  auto executor = co_await boost::asio::this_coro::executor;
  std::vector<BranchOp> ops;
  ops.reserve(branches.size());
  for (auto &branch : branches) {
    ops.push_back(co_spawn(executor, std::move(branch), boost::asio::deferred));
  }
  auto [order, exceptions] =
      co_await boost::asio::experimental::make_parallel_group(std::move(ops))
          .async_wait(boost::asio::experimental::wait_for_all(),
                      use_awaitable);
  co_return std::move(exceptions);
}

[[nodiscard]] auto describe(const std::exception_ptr &ep) -> std::string {
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace

auto ActionChainExecutor::run(const ActionTree &tree, ActionMessage initial,
                              ChainRunContext ctx) -> task<ChainResult> {
  RunState state{.tree = tree, .ctx = std::move(ctx), .planned = tree.size()};
  log::debug("Task {} starting chain of {} action(s)", state.ctx.task_id,
             tree.size());

  std::vector<task<void>> branches;
  for (auto [pos, root] : tree.roots() | std::views::enumerate) {
    branches.push_back(run_action(state, root, initial, std::to_string(pos)));
  }
  for (const auto &ep : co_await run_all(std::move(branches))) {
    if (ep) {
      state.fail(std::format("branch aborted: {}", describe(ep)));
    }
  }

  ChainResult result{.final_message = std::move(state.final_message),
                     .logs = std::move(state.logs),
                     .completed = state.completed,
                     .planned = state.planned};
  if (state.stop_requested()) {
    result.status = TaskStatus::Interrupted;
    result.status_message = "stopped on request";
  } else if (state.failed) {
    result.status = TaskStatus::Error;
    result.status_message = std::move(state.first_error);
  } else {
    result.status = TaskStatus::Finished;
    result.status_message = "finished";
  }
  log::debug("Task {} chain ended {} ({}/{})", state.ctx.task_id,
             to_string_view(result.status), result.completed, result.planned);
  co_return result;
}

auto ActionChainExecutor::record(RunState &state, ActionIndex idx,
                                 std::string branch, ActionMessage input,
                                 ActionMessage output) -> task<void> {
  ++state.completed;
  ActionLog entry{.action_index = idx,
                  .action_id = state.tree.action(idx).id,
                  .branch = std::move(branch),
                  .input = std::move(input),
                  .output = std::move(output)};
  if (state.ctx.callbacks.on_log) {
    co_await state.ctx.callbacks.on_log(entry);
  }
  state.logs.push_back(std::move(entry));
  if (state.ctx.callbacks.on_progress) {
    co_await state.ctx.callbacks.on_progress(state.completed, state.planned);
  }
}

auto ActionChainExecutor::run_action(RunState &state, ActionIndex idx,
                                     ActionMessage input, std::string branch)
    -> task<void> {
  const auto &action = state.tree.action(idx);
  const auto subtree = state.tree.subtree_size(idx);

  if (!co_await state.checkpoint()) {
    state.cut(subtree);
    co_return;
  }

  // Outcomes decided before any handler runs end the branch here.
  auto settle = [&](ActionOutput output) -> task<void> {
    auto out = input;
    out.append_output(std::move(output));
    co_await record(state, idx, branch + ":0", input, std::move(out));
    state.cut(subtree - 1);
  };

  if (!resolver_.accepts(action.source_filter, input)) {
    co_await settle(ActionOutput::skipped("source filter rejected message"));
    co_return;
  }

  auto selection =
      co_await resolver_.resolve(action.selector, action.filter, input);
  if (!selection) {
    auto error = std::format("selector resolution failed: {}",
                             selection.error().message());
    if (!action.tolerant) {
      state.fail(std::format("action {} on branch {}: {}", action.id, branch,
                             error));
    }
    co_await settle(ActionOutput::failure(std::move(error)));
    co_return;
  }
  if (selection->empty()) {
    co_await settle(ActionOutput::skipped("no target matched the selectors"));
    co_return;
  }

  auto *handler = registry_.find(action.id.value());
  if (handler == nullptr) {
    auto error = std::format("{}: no handler registered for '{}'",
                             make_error_code(Error::ConfigurationError).message(),
                             action.id);
    state.fail(std::format("action {} on branch {}: {}", action.id, branch,
                           error));
    co_await settle(ActionOutput::failure(std::move(error)));
    co_return;
  }

  std::vector<ActionMessage> inputs;
  switch (selection->kind) {
  case SelectionKind::Passthrough:
    inputs.push_back(std::move(input));
    break;
  case SelectionKind::Nodes:
    if (selection->collect) {
      input.nodes = std::move(selection->nodes);
      inputs.push_back(std::move(input));
      break;
    }
    for (auto &node : selection->nodes) {
      auto msg = input;
      msg.nodes = {std::move(node)};
      inputs.push_back(std::move(msg));
    }
    break;
  case SelectionKind::Users:
    if (selection->collect) {
      input.users = std::move(selection->users);
      inputs.push_back(std::move(input));
      break;
    }
    for (auto &user : selection->users) {
      auto msg = input;
      msg.users = {std::move(user)};
      inputs.push_back(std::move(msg));
    }
    break;
  }

  if (inputs.size() == 1) {
    co_await run_invocation(state, idx, *handler, std::move(inputs.front()),
                            branch + ":0");
    co_return;
  }

  state.planned += (inputs.size() - 1) * subtree;
  std::vector<task<void>> invocations;
  invocations.reserve(inputs.size());
  for (auto [ordinal, msg] : inputs | std::views::enumerate) {
    invocations.push_back(run_invocation(state, idx, *handler, std::move(msg),
                                         std::format("{}:{}", branch, ordinal)));
  }
  for (const auto &ep : co_await run_all(std::move(invocations))) {
    if (ep) {
      state.fail(std::format("action {} aborted: {}", action.id, describe(ep)));
    }
  }
}

auto ActionChainExecutor::run_invocation(RunState &state, ActionIndex idx,
                                         IActionHandler &handler,
                                         ActionMessage input,
                                         std::string branch) -> task<void> {
  const auto &action = state.tree.action(idx);
  const auto subtree = state.tree.subtree_size(idx);

  if (!co_await state.checkpoint()) {
    state.cut(subtree);
    co_return;
  }

  static const TaskControl kNoControl;
  ActionContext ctx{.action = action,
                    .job_id = state.ctx.job_id,
                    .task_id = state.ctx.task_id,
                    .branch = branch,
                    .control = state.ctx.control ? *state.ctx.control
                                                 : kNoControl};

  const auto before = input.output_chain.size();
  const auto started = std::chrono::steady_clock::now();
  Result<ActionMessage> result = fail(Error::Unknown);
  std::string thrown;
  try {
    result = co_await handler.run(ctx, input);
  } catch (const std::exception &e) {
    thrown = e.what();
  } catch (...) {
    thrown = "unknown exception";
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  ActionMessage output;
  if (!thrown.empty()) {
    output = input;
    output.append_output(
        ActionOutput::failure(std::format("handler threw: {}", thrown)));
  } else if (!result) {
    output = input;
    output.append_output(ActionOutput::failure(
        std::format("{}: {}", make_error_code(Error::ActionFailed).message(),
                    result.error().message())));
  } else {
    output = std::move(*result);
    if (output.output_chain.size() == before) {
      output.append_output(ActionOutput{});
    } else if (output.output_chain.size() != before + 1) {
      const auto produced = output.output_chain.size();
      output = input;
      output.append_output(ActionOutput::failure(std::format(
          "handler returned {} outputs for {} inputs", produced, before)));
    }
  }
  output.output_chain.back().elapsed = elapsed;

  const bool late = state.stop_requested();
  const auto last = output.output_chain.back();
  co_await record(state, idx, branch, std::move(input), output);

  if (late) {
    log::debug("Task {}: result of {} on branch {} arrived after stop",
               state.ctx.task_id, action.id, branch);
    state.cut(subtree - 1);
    co_return;
  }
  if (!last.success && !action.tolerant) {
    state.fail(std::format("action {} failed on branch {}: {}", action.id,
                           branch, last.error_string));
    state.cut(subtree - 1);
    co_return;
  }
  if (last.ignored) {
    state.cut(subtree - 1);
    co_return;
  }

  if (state.tree.children(idx).empty()) {
    state.final_message = std::move(output);
    co_return;
  }
  co_await run_children(state, idx, std::move(output), branch);
}

auto ActionChainExecutor::run_children(RunState &state, ActionIndex idx,
                                       ActionMessage input,
                                       const std::string &branch)
    -> task<void> {
  std::vector<task<void>> branches;
  for (auto [pos, child] : state.tree.children(idx) | std::views::enumerate) {
    branches.push_back(
        run_action(state, child, input, std::format("{}/{}", branch, pos)));
  }
  for (const auto &ep : co_await run_all(std::move(branches))) {
    if (ep) {
      state.fail(std::format("branch aborted: {}", describe(ep)));
    }
  }
}

} // namespace jobforge

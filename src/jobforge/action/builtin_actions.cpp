#include "jobforge/action/handler.hpp"

#include "jobforge/util/json.hpp"
#include "jobforge/util/log.hpp"
#include "jobforge/util/time.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 4UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr auto kSleepSlice = std::chrono::milliseconds(50);
inline constexpr auto kDefaultShellTimeout = std::chrono::hours(1);

[[nodiscard]] auto duration_param(const Action &action, std::string_view name,
                                  std::chrono::milliseconds fallback)
    -> Result<std::chrono::milliseconds> {
  auto text = action.parameter(name);
  if (!text || text->empty()) {
    return ok(fallback);
  }
  auto parsed = util::parse_iso8601_duration(*text);
  if (!parsed) {
    return fail(Error::InvalidArgument);
  }
  return parsed;
}

[[nodiscard]] auto join_lines(const std::vector<std::string> &items)
    -> std::string {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += item;
  }
  return out;
}

class LogAction final : public IActionHandler {
public:
  [[nodiscard]] auto run(const ActionContext &ctx, ActionMessage input)
      -> task<Result<ActionMessage>> override {
    const auto message = ctx.action.parameter("message").value_or("");
    log::info("[job {} task {} branch {}] {} ({} nodes, {} users)", ctx.job_id,
              ctx.task_id, ctx.branch, message, input.nodes.size(),
              input.users.size());
    input.append_output(ActionOutput{.string_body = std::string(message)});
    co_return ok(std::move(input));
  }
};

class SleepAction final : public IActionHandler {
public:
  [[nodiscard]] auto run(const ActionContext &ctx, ActionMessage input)
      -> task<Result<ActionMessage>> override {
    auto duration =
        duration_param(ctx.action, "duration", std::chrono::seconds(1));
    if (!duration) {
      co_return fail(duration.error());
    }

    const auto deadline = std::chrono::steady_clock::now() + *duration;
    while (std::chrono::steady_clock::now() < deadline) {
      if (ctx.control.stop_requested()) {
        input.append_output(ActionOutput::failure("interrupted while sleeping"));
        co_return ok(std::move(input));
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (!co_await async_sleep(std::min(left, kSleepSlice))) {
        co_return fail(Error::Cancelled);
      }
    }
    input.append_output(ActionOutput{
        .string_body = util::format_iso8601_duration(*duration)});
    co_return ok(std::move(input));
  }
};

[[nodiscard]] auto build_process_env(const ActionMessage &input)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);
  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    const std::string key(key_sv.data(), key_sv.size());
    if (key == "JOBFORGE_NODE_PATHS" || key == "JOBFORGE_USER_LOGINS") {
      continue;
    }
    env_vec.emplace_back(entry);
  }

  std::vector<std::string> paths;
  std::ranges::transform(input.nodes, std::back_inserter(paths),
                         [](const Node &n) { return n.path; });
  std::vector<std::string> logins;
  std::ranges::transform(input.users, std::back_inserter(logins),
                         [](const User &u) { return u.login; });

  env_vec.emplace_back(bp::environment::key{"JOBFORGE_NODE_PATHS"},
                       bp::environment::value{join_lines(paths)});
  env_vec.emplace_back(bp::environment::key{"JOBFORGE_USER_LOGINS"},
                       bp::environment::value{join_lines(logins)});
  return bp::process_environment(std::move(env_vec));
}

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out,
                                 boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      co_return;
    }
    if (bytes > 0 && out.size() < kMaxOutputSize) {
      out.append(buffer.data(),
                 std::min<std::size_t>(kMaxOutputSize - out.size(), bytes));
    }
  }
}

struct WaitResult {
  int exit_code{-1};
  bool timed_out{false};
};

[[nodiscard]] auto wait_with_timeout(bp::process &proc,
                                     std::chrono::milliseconds timeout,
                                     boost::asio::cancellation_signal &cancel_sig)
    -> task<WaitResult> {
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    co_return WaitResult{.exit_code = exit_code};
  }
  if (ec == boost::asio::error::operation_aborted) {
    cancel_sig.emit(boost::asio::cancellation_type::total);
    boost::system::error_code terminate_ec;
    proc.terminate(terminate_ec);
    if (terminate_ec) {
      log::warn("Failed to terminate timed out process {}: {}", proc.id(),
                terminate_ec.message());
    }
    co_await proc.async_wait(use_nothrow);
    co_return WaitResult{.timed_out = true};
  }
  co_return WaitResult{};
}

class ShellAction final : public IActionHandler {
public:
  // A spawned process runs to completion or timeout; a pause request could
  // only take effect after it.
  [[nodiscard]] auto capabilities() const -> HandlerCapabilities override {
    return {.can_pause = false};
  }

  [[nodiscard]] auto run(const ActionContext &ctx, ActionMessage input)
      -> task<Result<ActionMessage>> override {
    const auto command = ctx.action.parameter("command");
    if (!command || command->empty()) {
      co_return fail(Error::InvalidArgument);
    }
    auto timeout =
        duration_param(ctx.action, "timeout",
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           kDefaultShellTimeout));
    if (!timeout) {
      co_return fail(timeout.error());
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::readable_pipe stdout_pipe(executor);
    boost::asio::readable_pipe stderr_pipe(executor);
    std::string out;
    std::string err;

    std::optional<bp::process> proc;
    try {
      std::vector<std::string> args{"-c", std::string(*command)};
      proc.emplace(executor, "/bin/sh", args,
                   bp::process_stdio{
                       .in = nullptr, .out = stdout_pipe, .err = stderr_pipe},
                   build_process_env(input));
    } catch (const std::exception &e) {
      input.append_output(
          ActionOutput::failure(std::format("spawn failed: {}", e.what())));
      co_return ok(std::move(input));
    }
    log::debug("shell started pid={} task={} branch={}", proc->id(),
               ctx.task_id, ctx.branch);

    boost::asio::cancellation_signal cancel_sig;
    using namespace boost::asio::experimental::awaitable_operators;
    auto waited = co_await (read_pipe_all(stdout_pipe, out, cancel_sig) &&
                            read_pipe_all(stderr_pipe, err, cancel_sig) &&
                            wait_with_timeout(*proc, *timeout, cancel_sig));

    ActionOutput output{.raw_body = out, .string_body = std::move(out)};
    if (waited.timed_out) {
      output.success = false;
      output.error_string = std::format(
          "{}: command exceeded {}", make_error_code(Error::Timeout).message(),
          util::format_iso8601_duration(*timeout));
    } else if (waited.exit_code != 0) {
      output.success = false;
      output.error_string =
          err.empty() ? std::format("exit code {}", waited.exit_code) : err;
    } else {
      output.json_body = sniff_json_document(output.string_body);
    }
    log::debug("shell finished task={} exit_code={} timed_out={}", ctx.task_id,
               waited.exit_code, waited.timed_out);
    input.append_output(std::move(output));
    co_return ok(std::move(input));
  }
};

} // namespace

auto register_builtin_actions(ActionRegistry &registry) -> void {
  registry.register_handler("log", std::make_shared<LogAction>());
  registry.register_handler("sleep", std::make_shared<SleepAction>());
  registry.register_handler("shell", std::make_shared<ShellAction>());
}

} // namespace jobforge

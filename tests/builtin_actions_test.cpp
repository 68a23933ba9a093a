#include "jobforge/action/handler.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <string>

#include "gtest/gtest.h"

using namespace jobforge;
using namespace jobforge::test;

namespace {

class BuiltinActionsTest : public ::testing::Test {
protected:
  void SetUp() override { register_builtin_actions(registry_); }

  auto invoke(const Action &action, ActionMessage input = {})
      -> Result<ActionMessage> {
    auto *handler = registry_.find(action.id.value());
    if (handler == nullptr) {
      return fail(Error::NotFound);
    }
    ActionContext ctx{.action = action,
                      .job_id = JobId{"job"},
                      .task_id = TaskId{"task"},
                      .branch = "0:0",
                      .control = control_};
    return run_coro(handler->run(ctx, std::move(input)));
  }

  static auto shell(std::string command, std::string timeout = {}) -> Action {
    auto action = make_action("shell");
    action.parameters.emplace("command", std::move(command));
    if (!timeout.empty()) {
      action.parameters.emplace("timeout", std::move(timeout));
    }
    return action;
  }

  ActionRegistry registry_;
  TaskControl control_;
};

} // namespace

TEST_F(BuiltinActionsTest, RegistersLogSleepAndShell) {
  auto ids = registry_.ids();
  std::ranges::sort(ids);
  EXPECT_EQ(ids, (std::vector<std::string>{"log", "shell", "sleep"}));
  EXPECT_FALSE(registry_.contains("missing"));
}

TEST_F(BuiltinActionsTest, CapabilitiesIntersectAcrossTheTree) {
  EXPECT_TRUE(registry_.capabilities_of(single_action("sleep")).can_pause);
  EXPECT_FALSE(registry_.capabilities_of(single_action("sleep")).has_progress);

  auto shell = registry_.capabilities_of(single_action("shell"));
  EXPECT_TRUE(shell.can_stop);
  EXPECT_FALSE(shell.can_pause);

  ActionTree tree;
  auto root = tree.add_root(make_action("log", "first")).value();
  ASSERT_TRUE(tree.add_chained(root, make_action("shell", "second")).has_value());
  auto mixed = registry_.capabilities_of(tree);
  EXPECT_TRUE(mixed.can_stop);
  EXPECT_FALSE(mixed.can_pause);
  EXPECT_TRUE(mixed.has_progress);
}

TEST_F(BuiltinActionsTest, LogEchoesMessage) {
  auto action = make_action("log");
  action.parameters.emplace("message", "hello");
  auto r = invoke(action);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->output_chain.size(), 1U);
  EXPECT_TRUE(r->output_chain[0].success);
  EXPECT_EQ(r->output_chain[0].string_body, "hello");
}

TEST_F(BuiltinActionsTest, SleepCompletes) {
  auto action = make_action("sleep");
  action.parameters.emplace("duration", "PT0.05S");
  auto r = invoke(action);
  ASSERT_TRUE(r.has_value());
  ASSERT_NE(r->last_output(), nullptr);
  EXPECT_TRUE(r->last_output()->success);
}

TEST_F(BuiltinActionsTest, SleepRejectsBadDuration) {
  auto action = make_action("sleep");
  action.parameters.emplace("duration", "five seconds");
  EXPECT_EQ(invoke(action).error(), make_error_code(Error::InvalidArgument));
}

TEST_F(BuiltinActionsTest, SleepObservesStop) {
  auto action = make_action("sleep");
  action.parameters.emplace("duration", "PT30S");
  control_.stop();
  auto r = invoke(action);
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->last_output()->success);
  EXPECT_EQ(r->last_output()->error_string, "interrupted while sleeping");
}

TEST_F(BuiltinActionsTest, ShellCapturesStdout) {
  auto r = invoke(shell("echo hi"));
  ASSERT_TRUE(r.has_value());
  const auto *out = r->last_output();
  ASSERT_NE(out, nullptr);
  EXPECT_TRUE(out->success);
  EXPECT_EQ(out->string_body, "hi\n");
  EXPECT_FALSE(out->json_body.has_value());
}

TEST_F(BuiltinActionsTest, ShellNonZeroExitFails) {
  auto r = invoke(shell("echo oops >&2; exit 3"));
  ASSERT_TRUE(r.has_value());
  const auto *out = r->last_output();
  EXPECT_FALSE(out->success);
  EXPECT_EQ(out->error_string, "oops\n");

  auto silent = invoke(shell("exit 4"));
  ASSERT_TRUE(silent.has_value());
  EXPECT_EQ(silent->last_output()->error_string, "exit code 4");
}

TEST_F(BuiltinActionsTest, ShellParsesJsonOutput) {
  auto r = invoke(shell(R"(echo '{"count": 2}')"));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->last_output()->success);
  EXPECT_TRUE(r->last_output()->json_body.has_value());
}

TEST_F(BuiltinActionsTest, ShellTimesOut) {
  auto r = invoke(shell("sleep 5", "PT0.2S"));
  ASSERT_TRUE(r.has_value());
  const auto *out = r->last_output();
  EXPECT_FALSE(out->success);
  EXPECT_NE(out->error_string.find("timeout"), std::string::npos);
}

TEST_F(BuiltinActionsTest, ShellSeesSelectedEntities) {
  ActionMessage input;
  input.nodes = {node("/a"), node("/b")};
  input.users = {user("carol")};
  auto r = invoke(shell(R"(printf '%s|%s' "$JOBFORGE_NODE_PATHS" "$JOBFORGE_USER_LOGINS")"),
                  input);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->last_output()->string_body, "/a\n/b|carol");
  EXPECT_EQ(r->nodes.size(), 2U);
}

TEST_F(BuiltinActionsTest, ShellRequiresCommand) {
  EXPECT_EQ(invoke(make_action("shell")).error(),
            make_error_code(Error::InvalidArgument));
}

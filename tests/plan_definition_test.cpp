#include "planforge/action/action_registry.hpp"
#include "planforge/config/plan_definition.hpp"
#include "planforge/engine/engine.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace planforge {
namespace {

using namespace std::chrono_literals;
using test::run_coro;

class PlanDefinitionTest : public ::testing::Test {
protected:
  static auto load(std::string_view toml, std::string *diag = nullptr)
      -> Result<PlanDefinition> {
    return PlanDefinitionLoader::load_from_string(toml, diag);
  }

  static auto load_and_bind(std::string_view toml)
      -> std::shared_ptr<const Plan> {
    std::string diag;
    auto def = load(toml, &diag);
    if (!def) {
      throw std::runtime_error("load failed: " + diag);
    }
    auto plan = bind_plan(*def, ActionRegistry::with_builtins(), &diag);
    if (!plan) {
      throw std::runtime_error("bind failed: " + diag);
    }
    return *plan;
  }

  static auto execute(std::shared_ptr<const Plan> plan, JsonValue input = {},
                      EngineCallbacks callbacks = {})
      -> task<ExecutionResult> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex, {}, std::move(callbacks));
    co_return co_await engine.execute(std::move(plan), std::move(input));
  }
};

TEST_F(PlanDefinitionTest, LoadsFullDefinition) {
  auto def = load(R"(
id = "nightly"
name = "Nightly import"
description = "pulls and loads"
strategy = "dag"
global_timeout_ms = 60000

[defaults]
timeout_ms = 5000
max_attempts = 2

[[tasks]]
id = "extract"
action = "echo"
value = "{\"rows\": 3}"

[[tasks]]
id = "load"
action = "sleep"
delay_ms = 10
depends_on = ["extract"]
max_attempts = 4
base_delay_ms = 100
backoff = "exponential"
max_delay_ms = 1000
retry_on = ["ECONNRESET"]
compensate = "log"
)");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->id, PlanId{"nightly"});
  EXPECT_EQ(def->name, "Nightly import");
  EXPECT_EQ(def->description, "pulls and loads");
  EXPECT_EQ(def->strategy, Strategy::Dag);
  EXPECT_EQ(def->global_timeout, 60000ms);
  ASSERT_EQ(def->tasks.size(), 2U);

  const auto *extract = def->find_task(TaskId{"extract"});
  ASSERT_NE(extract, nullptr);
  EXPECT_EQ(extract->name, "extract");
  EXPECT_EQ(extract->timeout, 5000ms);
  ASSERT_TRUE(extract->retry.has_value());
  EXPECT_EQ(extract->retry->max_attempts, 2);
  ASSERT_TRUE(extract->params.value.has_value());
  EXPECT_EQ(dump_json(*extract->params.value), R"({"rows":3})");

  const auto *load_task = def->find_task(TaskId{"load"});
  ASSERT_NE(load_task, nullptr);
  ASSERT_EQ(load_task->depends_on.size(), 1U);
  EXPECT_EQ(load_task->depends_on[0], TaskId{"extract"});
  EXPECT_EQ(load_task->params.delay, 10ms);
  EXPECT_EQ(load_task->compensate, "log");
  ASSERT_TRUE(load_task->retry.has_value());
  EXPECT_EQ(load_task->retry->max_attempts, 4);
  EXPECT_EQ(load_task->retry->base_delay, 100ms);
  EXPECT_EQ(load_task->retry->backoff, BackoffKind::Exponential);
  EXPECT_EQ(load_task->retry->max_delay, 1000ms);
  ASSERT_EQ(load_task->retry->retryable_errors.size(), 1U);
  EXPECT_EQ(load_task->retry->retryable_errors[0], "ECONNRESET");
}

TEST_F(PlanDefinitionTest, DefaultsToSequentialWithoutRetry) {
  auto def = load(R"(
id = "plain"

[[tasks]]
id = "only"
action = "echo"
)");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->strategy, Strategy::Sequential);
  EXPECT_FALSE(def->global_timeout.has_value());
  ASSERT_EQ(def->tasks.size(), 1U);
  EXPECT_FALSE(def->tasks[0].retry.has_value());
  EXPECT_FALSE(def->tasks[0].timeout.has_value());
}

TEST_F(PlanDefinitionTest, MissingIdGivesHint) {
  std::string diag;
  auto def = load(R"(
[[tasks]]
id = "a"
action = "echo"
)",
                  &diag);
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), Error::InvalidArgument);
  EXPECT_NE(diag.find("Hint"), std::string::npos);
}

TEST_F(PlanDefinitionTest, ReportsStructuralErrorsTogether) {
  std::string diag;
  auto def = load(R"(
id = "broken"
strategy = "dag"

[[tasks]]
id = "a"
action = "echo"
depends_on = ["ghost"]

[[tasks]]
id = "a"
action = "echo"
)",
                  &diag);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diag.find("Duplicate task ID: 'a'"), std::string::npos) << diag;
  EXPECT_NE(diag.find("dependency 'ghost' not found"), std::string::npos)
      << diag;
}

TEST_F(PlanDefinitionTest, RejectsCycle) {
  std::string diag;
  auto def = load(R"(
id = "loop"
strategy = "dag"

[[tasks]]
id = "a"
action = "echo"
depends_on = ["b"]

[[tasks]]
id = "b"
action = "echo"
depends_on = ["a"]
)",
                  &diag);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diag.find("Circular dependency"), std::string::npos);
}

TEST_F(PlanDefinitionTest, RejectsUnknownStrategyAndBackoff) {
  std::string diag;
  auto def = load(R"(
id = "odd"
strategy = "whenever"

[[tasks]]
id = "a"
action = "echo"
backoff = "sometimes"
)",
                  &diag);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diag.find("Unknown strategy 'whenever'"), std::string::npos);
  EXPECT_NE(diag.find("unknown backoff 'sometimes'"), std::string::npos);
}

TEST_F(PlanDefinitionTest, RejectsEmptyPlanAndUnknownCompensation) {
  EXPECT_FALSE(load("id = \"empty\"\n").has_value());

  std::string diag;
  auto def = load(R"(
id = "undo"

[[tasks]]
id = "a"
action = "echo"
compensate = "rollback_everything"
)",
                  &diag);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diag.find("unknown compensation"), std::string::npos);
}

TEST_F(PlanDefinitionTest, LoadFromMissingFile) {
  std::string diag;
  auto def = PlanDefinitionLoader::load_from_file("/nonexistent/plan.toml",
                                                  &diag);
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), Error::FileNotFound);
  EXPECT_FALSE(diag.empty());
}

TEST_F(PlanDefinitionTest, LoadFromFile) {
  auto path =
      std::filesystem::temp_directory_path() / "planforge_plan_test.toml";
  {
    std::ofstream out(path);
    out << "id = \"from_disk\"\n\n[[tasks]]\nid = \"a\"\naction = \"echo\"\n";
  }
  auto def = PlanDefinitionLoader::load_from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->id, PlanId{"from_disk"});
}

TEST_F(PlanDefinitionTest, RegistryRejectsDuplicatesAndUnknownNames) {
  auto registry = ActionRegistry::with_builtins();
  auto names = registry.names();
  std::vector<std::string> expected = {"echo",  "fail", "flaky",
                                       "increment", "log", "sleep"};
  EXPECT_EQ(names, expected);

  auto dup = registry.register_action(
      "echo", [](const ActionParams &) -> Result<TaskBody> {
        return fail(Error::Unknown);
      });
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error(), Error::AlreadyExists);

  auto missing = registry.create("teleport", ActionParams{});
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(PlanDefinitionTest, BindRejectsUnknownAction) {
  auto def = load(R"(
id = "magic"

[[tasks]]
id = "a"
action = "teleport"
)");
  ASSERT_TRUE(def.has_value());
  std::string diag;
  auto plan = bind_plan(*def, ActionRegistry::with_builtins(), &diag);
  ASSERT_FALSE(plan);
  EXPECT_EQ(plan.error(), Error::NotFound);
  EXPECT_NE(diag.find("teleport"), std::string::npos);
}

TEST_F(PlanDefinitionTest, BoundPlanCarriesSettings) {
  auto plan = load_and_bind(R"(
id = "bound"
strategy = "dag"
global_timeout_ms = 9000

[[tasks]]
id = "a"
action = "echo"
timeout_ms = 700

[[tasks]]
id = "b"
action = "echo"
depends_on = ["a"]
compensate = "log"
)");
  EXPECT_EQ(plan->strategy, Strategy::Dag);
  EXPECT_EQ(plan->global_timeout, 9000ms);
  ASSERT_EQ(plan->tasks.size(), 2U);
  EXPECT_EQ(plan->tasks[0].timeout, 700ms);
  ASSERT_EQ(plan->tasks[1].dependencies.size(), 1U);
  EXPECT_EQ(plan->tasks[1].dependencies[0], TaskId{"a"});
  EXPECT_TRUE(static_cast<bool>(plan->tasks[1].compensate));
}

TEST_F(PlanDefinitionTest, BuiltinsRunEndToEnd) {
  auto plan = load_and_bind(R"(
id = "counter"
strategy = "sequential"

[[tasks]]
id = "start"
action = "echo"
value = "10"

[[tasks]]
id = "bump"
action = "increment"
amount = 5

[[tasks]]
id = "pause"
action = "sleep"
delay_ms = 5

[[tasks]]
id = "say"
action = "log"
message = "done counting"
)");
  std::vector<std::string> logged;
  std::vector<std::string> metrics;
  EngineCallbacks callbacks;
  callbacks.on_task_log = [&](const ExecutionId &, const TaskId &,
                              log::Level, std::string_view message) {
    logged.emplace_back(message);
  };
  callbacks.on_task_metric = [&](const ExecutionId &, const TaskId &,
                                 std::string_view name, double,
                                 const MetricTags &) {
    metrics.emplace_back(name);
  };

  auto result = run_coro(execute(plan, {}, std::move(callbacks)));
  EXPECT_EQ(result.status, RunStatus::Completed);
  const auto *last = result.result_for(TaskId{"say"});
  ASSERT_NE(last, nullptr);
  ASSERT_TRUE(last->output.has_value());
  EXPECT_EQ(dump_json(*last->output), "15");
  ASSERT_EQ(logged.size(), 1U);
  EXPECT_EQ(logged[0], "done counting");
  ASSERT_EQ(metrics.size(), 1U);
  EXPECT_EQ(metrics[0], "slept_ms");
}

TEST_F(PlanDefinitionTest, FlakyActionRecoversWithRetries) {
  auto plan = load_and_bind(R"(
id = "retrying"

[[tasks]]
id = "wobbly"
action = "flaky"
fail_times = 2
max_attempts = 3
base_delay_ms = 1
value = "\"steady\""
)");
  auto result = run_coro(execute(plan));
  EXPECT_EQ(result.status, RunStatus::Completed);
  const auto *r = result.result_for(TaskId{"wobbly"});
  ASSERT_NE(r, nullptr);
  EXPECT_EQ(r->attempts, 3);
  ASSERT_TRUE(r->output.has_value());
  EXPECT_EQ(dump_json(*r->output), "\"steady\"");
}

TEST_F(PlanDefinitionTest, FailActionUsesMessage) {
  auto plan = load_and_bind(R"(
id = "doomed"

[[tasks]]
id = "boom"
action = "fail"
message = "disk on fire"
)");
  auto result = run_coro(execute(plan));
  EXPECT_EQ(result.status, RunStatus::Failed);
  const auto *r = result.result_for(TaskId{"boom"});
  ASSERT_NE(r, nullptr);
  ASSERT_TRUE(r->error.has_value());
  EXPECT_EQ(r->error->message, "disk on fire");
}

TEST_F(PlanDefinitionTest, IncrementRejectsNonIntegerInput) {
  auto plan = load_and_bind(R"(
id = "typed"

[[tasks]]
id = "bump"
action = "increment"
)");
  auto result = run_coro(execute(plan, JsonValue(std::string{"seven"})));
  EXPECT_EQ(result.status, RunStatus::Failed);
  const auto *r = result.result_for(TaskId{"bump"});
  ASSERT_NE(r, nullptr);
  ASSERT_TRUE(r->error.has_value());
  EXPECT_NE(r->error->message.find("integer"), std::string::npos);
}

} // namespace
} // namespace planforge

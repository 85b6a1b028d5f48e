#include "planforge/engine/engine.hpp"

#include "planforge/engine/execution_context.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace planforge {
namespace {

using namespace std::chrono_literals;
using test::CallLog;
using test::fails;
using test::json_int;
using test::make_plan;
using test::make_task;
using test::returns;
using test::run_coro;

auto sleep_ms(std::chrono::milliseconds d) -> task<void> {
  [[maybe_unused]] auto elapsed = co_await sleep_for(d);
}

class EngineControlTest : public ::testing::Test {
protected:
  struct PauseObservation {
    bool paused{false};
    bool paused_again{false};
    int calls_while_paused{-1};
    bool resumed{false};
    RunStatus while_paused{RunStatus::Running};
    RunStatus after_resume{RunStatus::Paused};
    RunStatus status{RunStatus::Running};
    int calls_after{-1};
  };

  struct StreamObservation {
    std::vector<std::string> order;
    bool exhausted_again{false};
    ExecutionResult result;
  };

  static auto pause_then_resume(std::shared_ptr<const Plan> plan,
                                std::shared_ptr<CallLog> log)
      -> task<PauseObservation> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex);
    PauseObservation obs;
    auto stream = engine.execute_stream(plan);
    if (!stream) {
      co_return obs;
    }
    obs.paused = engine.pause(stream->id());
    obs.paused_again = engine.pause(stream->id());
    co_await sleep_ms(50ms);
    obs.calls_while_paused = log->calls;
    if (auto run = engine.find(stream->id())) {
      obs.while_paused = run->status();
    }
    obs.resumed = engine.resume(stream->id());
    if (auto run = engine.find(stream->id())) {
      obs.after_resume = run->status();
    }
    auto result = co_await stream->result();
    obs.status = result.status;
    obs.calls_after = log->calls;
    co_return obs;
  }

  static auto drain_stream(std::shared_ptr<const Plan> plan)
      -> task<StreamObservation> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex);
    StreamObservation obs;
    auto stream = engine.execute_stream(plan);
    if (!stream) {
      co_return obs;
    }
    while (auto item = co_await stream->next()) {
      obs.order.push_back(item->task_id.str());
    }
    obs.exhausted_again = !(co_await stream->next()).has_value();
    obs.result = co_await stream->result();
    co_return obs;
  }
};

TEST_F(EngineControlTest, CancelFromHookStopsSequentialRun) {
  auto third = std::make_shared<CallLog>();
  auto plan = make_plan(Strategy::Sequential,
                        make_task("first", returns(json_int(1))),
                        make_task("second", returns(json_int(2), 5s)),
                        make_task("third", returns({}, 0ms, third)));
  int cancelled_hooks = 0;

  auto result = run_coro([&]() -> task<ExecutionResult> {
    auto ex = co_await boost::asio::this_coro::executor;
    auto slot = std::make_shared<ExecutionEngine *>(nullptr);
    EngineCallbacks callbacks;
    callbacks.on_task_started = [slot](const ExecutionId &id,
                                       const TaskId &task, int) {
      if (task == "second") {
        (*slot)->cancel(id);
      }
    };
    callbacks.on_run_cancelled = [&](const ExecutionId &) {
      ++cancelled_hooks;
    };
    ExecutionEngine engine(ex, {}, std::move(callbacks));
    *slot = &engine;
    co_return co_await engine.execute(plan);
  }());

  EXPECT_EQ(result.status, RunStatus::Cancelled);
  EXPECT_EQ(cancelled_hooks, 1);
  EXPECT_EQ(third->calls, 0);
  ASSERT_NE(result.result_for(TaskId{"first"}), nullptr);
  EXPECT_EQ(result.result_for(TaskId{"first"})->status,
            TaskStatus::Completed);
  ASSERT_NE(result.result_for(TaskId{"second"}), nullptr);
  EXPECT_EQ(result.result_for(TaskId{"second"})->status,
            TaskStatus::Cancelled);
  EXPECT_EQ(result.result_for(TaskId{"third"}), nullptr);
}

TEST_F(EngineControlTest, PauseHoldsDispatchUntilResumed) {
  auto log = std::make_shared<CallLog>();
  auto plan = make_plan(Strategy::Sequential,
                        make_task("a", returns({}, 0ms, log)),
                        make_task("b", returns({}, 0ms, log)));
  auto obs = run_coro(pause_then_resume(plan, log));
  EXPECT_TRUE(obs.paused);
  EXPECT_FALSE(obs.paused_again);
  EXPECT_EQ(obs.calls_while_paused, 0);
  EXPECT_EQ(obs.while_paused, RunStatus::Paused);
  EXPECT_TRUE(obs.resumed);
  EXPECT_EQ(obs.after_resume, RunStatus::Running);
  EXPECT_EQ(obs.status, RunStatus::Completed);
  EXPECT_EQ(obs.calls_after, 2);
}

TEST_F(EngineControlTest, PauseHoldsParallelAndDagDispatch) {
  for (auto strategy : {Strategy::Parallel, Strategy::Dag}) {
    auto log = std::make_shared<CallLog>();
    auto second = TaskSpec::builder().id("b").execute(returns({}, 0ms, log));
    if (strategy == Strategy::Dag) {
      second.depends_on("a");
    }
    auto plan = make_plan(strategy, make_task("a", returns({}, 0ms, log)),
                          test::build(std::move(second)));
    auto obs = run_coro(pause_then_resume(plan, log));
    EXPECT_TRUE(obs.paused) << to_string_view(strategy);
    EXPECT_EQ(obs.calls_while_paused, 0) << to_string_view(strategy);
    EXPECT_EQ(obs.while_paused, RunStatus::Paused) << to_string_view(strategy);
    EXPECT_TRUE(obs.resumed) << to_string_view(strategy);
    EXPECT_EQ(obs.status, RunStatus::Completed) << to_string_view(strategy);
    EXPECT_EQ(obs.calls_after, 2) << to_string_view(strategy);
  }
}

TEST_F(EngineControlTest, CancelStopsDagScheduling) {
  auto child = std::make_shared<CallLog>();
  auto plan = make_plan(
      Strategy::Dag, make_task("root", returns(json_int(1), 5s)),
      test::build(TaskSpec::builder()
                      .id("child")
                      .execute(returns({}, 0ms, child))
                      .depends_on("root")));

  auto result = run_coro([plan]() -> task<ExecutionResult> {
    auto ex = co_await boost::asio::this_coro::executor;
    auto slot = std::make_shared<ExecutionEngine *>(nullptr);
    EngineCallbacks callbacks;
    callbacks.on_task_started = [slot](const ExecutionId &id,
                                       const TaskId &task, int) {
      if (task == "root") {
        (*slot)->cancel(id);
      }
    };
    ExecutionEngine engine(ex, {}, std::move(callbacks));
    *slot = &engine;
    co_return co_await engine.execute(plan);
  }());

  EXPECT_EQ(result.status, RunStatus::Cancelled);
  ASSERT_NE(result.result_for(TaskId{"root"}), nullptr);
  EXPECT_EQ(result.result_for(TaskId{"root"})->status, TaskStatus::Cancelled);
  EXPECT_EQ(result.result_for(TaskId{"child"}), nullptr);
  EXPECT_EQ(child->calls, 0);
}

TEST_F(EngineControlTest, GlobalTimeoutCancelsRun) {
  auto built = Plan::builder()
                   .id("bounded")
                   .strategy(Strategy::Sequential)
                   .global_timeout(40ms)
                   .task(make_task("sleepy", returns({}, 5s)))
                   .build_shared();
  ASSERT_TRUE(built);
  auto plan = *built;

  const auto start = std::chrono::steady_clock::now();
  auto result = run_coro([plan]() -> task<ExecutionResult> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex);
    co_return co_await engine.execute(plan);
  }());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_EQ(result.status, RunStatus::Timeout);
  ASSERT_NE(result.result_for(TaskId{"sleepy"}), nullptr);
  EXPECT_EQ(result.result_for(TaskId{"sleepy"})->status,
            TaskStatus::Cancelled);
}

TEST_F(EngineControlTest, StreamYieldsSequentialResultsInOrder) {
  auto plan = make_plan(Strategy::Sequential,
                        make_task("a", returns(json_int(1), 5ms)),
                        make_task("b", returns(json_int(2), 5ms)),
                        make_task("c", returns(json_int(3))));
  auto obs = run_coro(drain_stream(plan));
  ASSERT_EQ(obs.order.size(), 3U);
  EXPECT_EQ(obs.order[0], "a");
  EXPECT_EQ(obs.order[1], "b");
  EXPECT_EQ(obs.order[2], "c");
  EXPECT_TRUE(obs.exhausted_again);
  EXPECT_EQ(obs.result.status, RunStatus::Completed);
  EXPECT_EQ(obs.result.results.size(), 3U);
}

TEST_F(EngineControlTest, StreamYieldsParallelResultsByCompletion) {
  auto plan = make_plan(Strategy::Parallel,
                        make_task("slow", returns({}, 80ms)),
                        make_task("quick", returns({}, 5ms)),
                        make_task("medium", returns({}, 40ms)));
  auto obs = run_coro(drain_stream(plan));
  ASSERT_EQ(obs.order.size(), 3U);
  EXPECT_EQ(obs.order[0], "quick");
  EXPECT_EQ(obs.order[1], "medium");
  EXPECT_EQ(obs.order[2], "slow");
}

TEST_F(EngineControlTest, StreamYieldsDagResultsAsDependenciesSettle) {
  auto depends = [](std::string id, TaskBody body,
                    std::initializer_list<std::string> deps) {
    auto builder = TaskSpec::builder().id(std::move(id)).execute(std::move(body));
    for (const auto &dep : deps) {
      builder.depends_on(dep);
    }
    return test::build(std::move(builder));
  };
  auto plan = make_plan(Strategy::Dag,
                        depends("root", returns(json_int(1), 5ms), {}),
                        depends("left", returns(json_int(2), 60ms), {"root"}),
                        depends("right", returns(json_int(3), 5ms), {"root"}),
                        depends("join", returns({}), {"left", "right"}));
  auto obs = run_coro(drain_stream(plan));
  ASSERT_EQ(obs.order.size(), 4U);
  EXPECT_EQ(obs.order[0], "root");
  EXPECT_EQ(obs.order[1], "right");
  EXPECT_EQ(obs.order[2], "left");
  EXPECT_EQ(obs.order[3], "join");
  EXPECT_TRUE(obs.exhausted_again);
  EXPECT_EQ(obs.result.status, RunStatus::Completed);
  EXPECT_EQ(obs.result.results.size(), 4U);
}

TEST_F(EngineControlTest, StreamRejectsRaceAndAll) {
  auto codes = run_coro([]() -> task<std::vector<std::error_code>> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex);
    std::vector<std::error_code> out;
    for (auto strategy : {Strategy::Race, Strategy::All}) {
      auto stream = engine.execute_stream(
          make_plan(strategy, make_task("t", returns({}))));
      out.push_back(stream ? std::error_code{} : stream.error());
    }
    EXPECT_TRUE(engine.active_runs().empty());
    co_return out;
  }());
  ASSERT_EQ(codes.size(), 2U);
  EXPECT_EQ(codes[0], Error::UnsupportedStrategy);
  EXPECT_EQ(codes[1], Error::UnsupportedStrategy);
}

TEST_F(EngineControlTest, FinishedRunsAreDeregistered) {
  struct Observation {
    ExecutionResult result;
    bool found{true};
    bool cancel_accepted{true};
    bool pause_accepted{true};
    std::size_t active{1};
  };
  auto plan =
      make_plan(Strategy::Parallel, make_task("only", returns(json_int(1))));
  auto obs = run_coro([plan]() -> task<Observation> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex);
    Observation o;
    o.result = co_await engine.execute(plan);
    o.found = engine.find(o.result.execution_id) != nullptr;
    o.cancel_accepted = engine.cancel(o.result.execution_id);
    o.pause_accepted = engine.pause(o.result.execution_id);
    o.active = engine.active_runs().size();
    co_return o;
  }());
  EXPECT_EQ(obs.result.status, RunStatus::Completed);
  EXPECT_FALSE(obs.result.execution_id.empty());
  EXPECT_FALSE(obs.found);
  EXPECT_FALSE(obs.cancel_accepted);
  EXPECT_FALSE(obs.pause_accepted);
  EXPECT_EQ(obs.active, 0U);
}

TEST_F(EngineControlTest, MaxActiveRunsRejectsOverflow) {
  auto slow =
      make_plan(Strategy::Sequential, make_task("slow", returns({}, 5s)));
  auto quick =
      make_plan(Strategy::Sequential, make_task("quick", returns({})));

  struct Observation {
    ExecutionResult rejected;
    ExecutionResult first;
    EngineStats stats;
  };
  auto obs = run_coro([slow, quick]() -> task<Observation> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex, EngineOptions{.max_active_runs = 1});
    Observation o;
    auto stream = engine.execute_stream(slow);
    EXPECT_TRUE(stream.has_value());
    if (!stream) {
      co_return o;
    }
    EXPECT_EQ(engine.active_runs().size(), 1U);
    o.rejected = co_await engine.execute(quick);
    EXPECT_TRUE(engine.cancel(stream->id()));
    o.first = co_await stream->result();
    o.stats = engine.stats();
    co_return o;
  }());

  EXPECT_EQ(obs.rejected.status, RunStatus::Failed);
  EXPECT_EQ(obs.rejected.error, Error::ResourceExhausted);
  EXPECT_TRUE(obs.rejected.results.empty());
  EXPECT_EQ(obs.first.status, RunStatus::Cancelled);
  EXPECT_EQ(obs.stats.total, 2U);
  EXPECT_EQ(obs.stats.failed, 1U);
  EXPECT_EQ(obs.stats.cancelled, 1U);
  EXPECT_EQ(obs.stats.active, 0U);
}

TEST_F(EngineControlTest, StatsAndRunHooks) {
  struct Observation {
    EngineStats stats;
    int started{0};
    int completed{0};
    int failed{0};
  };
  auto good = make_plan(Strategy::Sequential, make_task("ok", returns({})));
  auto bad = make_plan(Strategy::Sequential, make_task("no", fails("x")));
  auto obs = run_coro([good, bad]() -> task<Observation> {
    auto ex = co_await boost::asio::this_coro::executor;
    auto o = std::make_shared<Observation>();
    EngineCallbacks callbacks;
    callbacks.on_run_started = [o](const ExecutionId &, const Plan &) {
      ++o->started;
    };
    callbacks.on_run_completed = [o](const ExecutionResult &) {
      ++o->completed;
    };
    callbacks.on_run_failed = [o](const ExecutionId &, std::error_code) {
      ++o->failed;
    };
    ExecutionEngine engine(ex, {}, std::move(callbacks));
    [[maybe_unused]] auto r1 = co_await engine.execute(good);
    [[maybe_unused]] auto r2 = co_await engine.execute(bad);
    [[maybe_unused]] auto r3 = co_await engine.execute(nullptr);
    o->stats = engine.stats();
    co_return *o;
  }());

  EXPECT_EQ(obs.started, 2);
  EXPECT_EQ(obs.completed, 2);
  EXPECT_EQ(obs.failed, 1);
  EXPECT_EQ(obs.stats.total, 3U);
  EXPECT_EQ(obs.stats.completed, 1U);
  EXPECT_EQ(obs.stats.failed, 2U);
  EXPECT_EQ(obs.stats.active, 0U);
}

TEST_F(EngineControlTest, NonStandardThrowsFromHooksAreContained) {
  auto built = Plan::builder()
                   .id("noisy")
                   .strategy(Strategy::Parallel)
                   .task(make_task("ok", returns(json_int(1))))
                   .task(make_task("bad", fails("down")))
                   .on_task_complete([](const TaskResult &) { throw 1; })
                   .on_task_error([](const TaskResult &) { throw 2; })
                   .build_shared();
  ASSERT_TRUE(built);
  auto plan = *built;

  auto result = run_coro([plan]() -> task<ExecutionResult> {
    auto ex = co_await boost::asio::this_coro::executor;
    EngineCallbacks callbacks;
    callbacks.on_task_started = [](const ExecutionId &, const TaskId &, int) {
      throw 3;
    };
    callbacks.on_run_completed = [](const ExecutionResult &) { throw 4; };
    ExecutionEngine engine(ex, {}, std::move(callbacks));
    co_return co_await engine.execute(plan);
  }());

  EXPECT_EQ(result.status, RunStatus::Failed);
  ASSERT_EQ(result.results.size(), 2U);
  EXPECT_EQ(result.result_for(TaskId{"ok"})->status, TaskStatus::Completed);
  EXPECT_EQ(result.result_for(TaskId{"bad"})->status, TaskStatus::Failed);
}

TEST_F(EngineControlTest, UnknownIdsAreRejected) {
  boost::asio::io_context io;
  ExecutionEngine engine(io.get_executor());
  ExecutionId unknown{"nope"};
  EXPECT_FALSE(engine.cancel(unknown));
  EXPECT_FALSE(engine.pause(unknown));
  EXPECT_FALSE(engine.resume(unknown));
  EXPECT_EQ(engine.find(unknown), nullptr);
}

TEST_F(EngineControlTest, ExecutionResultSerializes) {
  auto plan = make_plan(Strategy::Sequential,
                        make_task("a", returns(json_int(5))));
  auto result = run_coro([plan]() -> task<ExecutionResult> {
    auto ex = co_await boost::asio::this_coro::executor;
    ExecutionEngine engine(ex);
    co_return co_await engine.execute(plan);
  }());
  auto text = dump_json(to_json(result));
  EXPECT_NE(text.find("\"status\":\"Completed\""), std::string::npos) << text;
  EXPECT_NE(text.find("\"a\""), std::string::npos) << text;
}

} // namespace
} // namespace planforge

#include "planforge/core/async_event.hpp"
#include "planforge/core/cancellation.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/steady_timer.hpp>

#include <chrono>

namespace planforge {
namespace {

using namespace std::chrono_literals;
using test::run_coro;

class CancellationTest : public ::testing::Test {
protected:
  static auto sleep_ms(std::chrono::milliseconds d) -> task<void> {
    [[maybe_unused]] auto elapsed = co_await sleep_for(d);
  }
};

TEST_F(CancellationTest, EventWakesEveryWaiter) {
  auto woken = run_coro([]() -> task<int> {
    auto ex = co_await boost::asio::this_coro::executor;
    auto event = std::make_shared<AsyncEvent>(ex);
    auto count = std::make_shared<int>(0);
    for (int i = 0; i < 3; ++i) {
      co_spawn(
          ex,
          [event, count]() -> task<void> {
            co_await event->wait();
            ++*count;
          },
          detached);
    }
    co_await sleep_ms(5ms);
    EXPECT_EQ(*count, 0);
    event->set();
    co_await sleep_ms(5ms);
    co_return *count;
  }());
  EXPECT_EQ(woken, 3);
}

TEST_F(CancellationTest, EventWaitForTimesOut) {
  auto [early, late] = run_coro([]() -> task<std::pair<bool, bool>> {
    auto ex = co_await boost::asio::this_coro::executor;
    AsyncEvent event(ex);
    const bool before = co_await event.wait_for(10ms);
    event.set();
    const bool after = co_await event.wait_for(10s);
    co_return std::pair{before, after};
  }());
  EXPECT_FALSE(early);
  EXPECT_TRUE(late);
}

TEST_F(CancellationTest, FirstCancelFixesReason) {
  boost::asio::io_context io;
  CancellationSource source(io.get_executor());
  auto token = source.token();
  EXPECT_FALSE(token.is_cancelled());
  EXPECT_EQ(token.reason(), CancelReason::None);

  EXPECT_TRUE(source.cancel(CancelReason::Timeout));
  EXPECT_FALSE(source.cancel(CancelReason::User));
  EXPECT_TRUE(token.is_cancelled());
  EXPECT_EQ(source.reason(), CancelReason::Timeout);
  EXPECT_EQ(token.reason(), CancelReason::Timeout);
}

TEST_F(CancellationTest, DefaultTokenNeverCancels) {
  auto token = CancellationToken::none();
  EXPECT_FALSE(token.is_cancelled());
  auto cancelled = run_coro(token.wait_for(5ms));
  EXPECT_FALSE(cancelled);
}

TEST_F(CancellationTest, TokenWaitForReturnsEarlyOnCancel) {
  auto [cancelled, elapsed] =
      run_coro([]() -> task<std::pair<bool, std::chrono::milliseconds>> {
        auto ex = co_await boost::asio::this_coro::executor;
        auto source = std::make_shared<CancellationSource>(ex);
        co_spawn(
            ex,
            [source]() -> task<void> {
              co_await sleep_ms(10ms);
              source->cancel(CancelReason::User);
            },
            detached);
        const auto start = std::chrono::steady_clock::now();
        const bool hit = co_await source->token().wait_for(5s);
        co_return std::pair{
            hit, std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)};
      }());
  EXPECT_TRUE(cancelled);
  EXPECT_LT(elapsed, 1000ms);
}

TEST_F(CancellationTest, PauseGateHoldsUntilResumed) {
  auto order = run_coro([]() -> task<std::vector<std::string>> {
    auto ex = co_await boost::asio::this_coro::executor;
    auto gate = std::make_shared<PauseGate>(ex);
    auto events = std::make_shared<std::vector<std::string>>();

    EXPECT_TRUE(gate->pause());
    EXPECT_FALSE(gate->pause());
    co_spawn(
        ex,
        [gate, events]() -> task<void> {
          co_await gate->wait_open();
          events->push_back("passed");
        },
        detached);

    co_await sleep_ms(10ms);
    events->push_back("resuming");
    EXPECT_TRUE(gate->resume());
    EXPECT_FALSE(gate->resume());
    co_await sleep_ms(10ms);
    co_return *events;
  }());
  ASSERT_EQ(order.size(), 2U);
  EXPECT_EQ(order[0], "resuming");
  EXPECT_EQ(order[1], "passed");
}

TEST_F(CancellationTest, OpenGateDoesNotSuspend) {
  boost::asio::io_context io;
  PauseGate gate(io.get_executor());
  EXPECT_FALSE(gate.is_paused());
  run_coro(gate.wait_open());
}

} // namespace
} // namespace planforge

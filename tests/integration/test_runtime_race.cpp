#include "streampump/core/errc.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/event_loop.hpp"
#include "streampump/runtime/io_ops.hpp"
#include "streampump/runtime/race.hpp"

#include <cerrno>
#include <chrono>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
namespace runtime = streampump::runtime;

runtime::task<streampump::result<int>> sleep_then(std::chrono::milliseconds delay,
                                                  int value,
                                                  runtime::cancel_token token) {
    const auto slept = co_await runtime::async_sleep(delay, token);
    if (!slept.has_value()) {
        co_return streampump::err<int>(slept.error());
    }
    co_return value;
}

runtime::task<streampump::result<std::string>> never_arrives(runtime::cancel_token token) {
    const auto waited = co_await runtime::wait_for_cancel(token);
    co_return streampump::err<std::string>(waited.error());
}

runtime::task<streampump::result<int>> throws_after(std::chrono::milliseconds delay) {
    const auto slept = co_await runtime::async_sleep(delay);
    if (slept.has_value()) {
        throw std::runtime_error("handler exploded");
    }
    co_return 0;
}

TEST(runtime_race_test, timer_beats_receive_that_never_completes) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    std::optional<runtime::race_pair_result<int, std::string>> outcome;
    const auto started = std::chrono::steady_clock::now();

    auto racer = [&]() -> runtime::task<void> {
        runtime::cancel_source source;
        outcome.emplace(co_await runtime::when_first(
            sleep_then(10ms, 7, source.token()), never_arrives(source.token()), source));
    };
    loop.spawn(racer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->winner, 0U);
    ASSERT_TRUE(outcome->first.has_value());
    EXPECT_EQ(outcome->first.value(), 7);
    ASSERT_FALSE(outcome->second.has_value());
    EXPECT_EQ(outcome->second.error().value(), ECANCELED);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    EXPECT_EQ(loop.active_tasks(), 0U);
}

TEST(runtime_race_test, fastest_of_many_wins_and_the_rest_are_cancelled) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    std::optional<runtime::race_result<int>> outcome;
    auto racer = [&]() -> runtime::task<void> {
        runtime::cancel_source source;
        std::vector<runtime::task<streampump::result<int>>> operations;
        operations.push_back(sleep_then(2s, 0, source.token()));
        operations.push_back(sleep_then(5ms, 1, source.token()));
        operations.push_back(sleep_then(3s, 2, source.token()));
        outcome.emplace(co_await runtime::when_first(std::move(operations), source));
    };
    loop.spawn(racer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->winner, 1U);
    ASSERT_EQ(outcome->results.size(), 3U);
    EXPECT_EQ(outcome->results[1].value(), 1);
    EXPECT_EQ(outcome->results[0].error().value(), ECANCELED);
    EXPECT_EQ(outcome->results[2].error().value(), ECANCELED);
}

TEST(runtime_race_test, each_round_starts_with_a_fresh_source) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    std::vector<int> winners;
    auto rounds = [&]() -> runtime::task<void> {
        for (int round = 0; round < 3; ++round) {
            runtime::cancel_source source;
            auto outcome = co_await runtime::when_first(
                sleep_then(2ms, round, source.token()), never_arrives(source.token()),
                source);
            if (outcome.first.has_value()) {
                winners.push_back(outcome.first.value());
            }
        }
    };
    loop.spawn(rounds());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    EXPECT_EQ(winners, (std::vector<int>{0, 1, 2}));
}

TEST(runtime_race_test, parent_token_cancels_both_arms) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    runtime::cancel_source session;
    std::optional<runtime::race_pair_result<int, std::string>> outcome;

    auto racer = [&]() -> runtime::task<void> {
        runtime::cancel_source round{session.token()};
        outcome.emplace(co_await runtime::when_first(
            sleep_then(5s, 1, round.token()), never_arrives(round.token()), round));
    };
    auto shutdown = [&]() -> runtime::task<void> {
        (void)co_await runtime::async_sleep(10ms);
        session.request_stop();
    };
    loop.spawn(racer());
    loop.spawn(shutdown());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(streampump::is_cancellation(outcome->first.error()));
    EXPECT_TRUE(streampump::is_cancellation(outcome->second.error()));
}

TEST(runtime_race_test, exception_from_an_arm_reaches_the_awaiter) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    bool caught = false;
    auto racer = [&]() -> runtime::task<void> {
        runtime::cancel_source source;
        std::vector<runtime::task<streampump::result<int>>> operations;
        operations.push_back(throws_after(1ms));
        operations.push_back(sleep_then(2s, 1, source.token()));
        try {
            (void)co_await runtime::when_first(std::move(operations), source);
        } catch (const std::runtime_error&) {
            caught = true;
        }
    };
    loop.spawn(racer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    EXPECT_TRUE(caught);
}

} // namespace

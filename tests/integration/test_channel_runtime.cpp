#include "streampump/core/errc.hpp"
#include "streampump/pipeline/bounded_channel.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/event_loop.hpp"
#include "streampump/runtime/io_ops.hpp"

#include <cerrno>
#include <chrono>
#include <gtest/gtest.h>
#include <optional>
#include <vector>

namespace {

using namespace std::chrono_literals;
namespace pipeline = streampump::pipeline;
namespace runtime = streampump::runtime;

TEST(channel_runtime_test, pop_suspends_until_a_timer_paced_producer_pushes) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    pipeline::bounded_channel<int> channel{4};

    std::vector<int> received;
    auto consumer = [&]() -> runtime::task<void> {
        while (true) {
            auto item = co_await channel.pop();
            if (!item.has_value()) {
                EXPECT_TRUE(item.error().is(streampump::errc::channel_closed));
                co_return;
            }
            received.push_back(item.value());
        }
    };
    auto producer = [&]() -> runtime::task<void> {
        for (int i = 1; i <= 3; ++i) {
            (void)co_await runtime::async_sleep(5ms);
            channel.try_push(i);
        }
        channel.close();
    };
    loop.spawn(consumer());
    loop.spawn(producer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    EXPECT_EQ(received, (std::vector<int>{1, 2, 3}));
}

TEST(channel_runtime_test, close_drains_queued_items_before_reporting_closed) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    pipeline::bounded_channel<int> channel{2};
    channel.try_push(10);
    channel.try_push(20);
    channel.close();
    EXPECT_EQ(channel.try_push(30), pipeline::push_outcome::closed);

    std::vector<int> received;
    std::optional<streampump::error> final_error;
    auto consumer = [&]() -> runtime::task<void> {
        while (true) {
            auto item = co_await channel.pop();
            if (!item.has_value()) {
                final_error = item.error();
                co_return;
            }
            received.push_back(item.value());
        }
    };
    loop.spawn(consumer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    EXPECT_EQ(received, (std::vector<int>{10, 20}));
    ASSERT_TRUE(final_error.has_value());
    EXPECT_TRUE(final_error->is(streampump::errc::channel_closed));
}

TEST(channel_runtime_test, cancellation_wakes_a_waiting_consumer) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    pipeline::bounded_channel<int> channel{1};
    runtime::cancel_source source;

    std::optional<streampump::result<int>> outcome;
    auto consumer = [&]() -> runtime::task<void> {
        outcome = co_await channel.pop(source.token());
    };
    auto canceller = [&]() -> runtime::task<void> {
        (void)co_await runtime::async_sleep(10ms);
        source.request_stop();
    };
    loop.spawn(consumer());
    loop.spawn(canceller());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().value(), ECANCELED);
}

TEST(channel_runtime_test, cancellation_wins_over_a_queued_item) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    pipeline::bounded_channel<int> channel{1};
    channel.try_push(5);
    runtime::cancel_source source;
    source.request_stop();

    std::optional<streampump::result<int>> outcome;
    auto consumer = [&]() -> runtime::task<void> {
        outcome = co_await channel.pop(source.token());
    };
    loop.spawn(consumer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().value(), ECANCELED);
    EXPECT_EQ(channel.size(), 1U);
}

TEST(channel_runtime_test, second_waiting_consumer_is_rejected) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    pipeline::bounded_channel<int> channel{1};

    std::optional<streampump::result<int>> first;
    std::optional<streampump::result<int>> second;
    auto first_consumer = [&]() -> runtime::task<void> {
        first = co_await channel.pop();
    };
    auto second_consumer = [&]() -> runtime::task<void> {
        second = co_await channel.pop();
        channel.try_push(1);
    };
    loop.spawn(first_consumer());
    loop.spawn(second_consumer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    ASSERT_TRUE(second.has_value());
    ASSERT_FALSE(second->has_value());
    EXPECT_EQ(second->error().value(), EBUSY);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->has_value());
    EXPECT_EQ(first->value(), 1);
}

TEST(channel_runtime_test, consumer_with_no_producer_is_reported_as_deadlock) {
    runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    pipeline::bounded_channel<int> channel{1};

    auto consumer = [&]() -> runtime::task<void> {
        (void)co_await channel.pop();
    };
    loop.spawn(consumer());

    const auto run_result = loop.run();
    ASSERT_FALSE(run_result.has_value());
    EXPECT_EQ(run_result.error().value(), EDEADLK);
}

} // namespace

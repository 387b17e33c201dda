#include "streampump/blocking/tcp.hpp"
#include "streampump/core/errc.hpp"
#include "streampump/nonblocking/tcp.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/event_loop.hpp"
#include "streampump/runtime/io_ops.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <future>
#include <gtest/gtest.h>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

using namespace std::chrono_literals;

struct pipe_pair {
    streampump::unique_fd read_end;
    streampump::unique_fd write_end;
};

pipe_pair make_pipe() {
    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_NONBLOCK | O_CLOEXEC) != 0) {
        return {};
    }
    return {streampump::unique_fd{fds[0]}, streampump::unique_fd{fds[1]}};
}

bool poke(const streampump::unique_fd& fd) {
    constexpr std::byte marker{0x42};
    return ::write(fd.get(), &marker, 1) == 1;
}

TEST(runtime_coroutines_test, readers_resume_as_their_data_arrives_and_cancel_releases_the_rest) {
    streampump::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    std::array<pipe_pair, 3> pipes{make_pipe(), make_pipe(), make_pipe()};
    for (const auto& pipe : pipes) {
        ASSERT_TRUE(pipe.read_end.valid());
    }

    streampump::runtime::cancel_source stop;
    std::vector<std::size_t> woke;
    std::array<std::optional<streampump::result<void>>, 3> outcomes{};

    auto reader = [&](std::size_t index) -> streampump::runtime::task<void> {
        outcomes[index] = co_await streampump::runtime::wait_readable(
            pipes[index].read_end.get(), stop.token());
        woke.push_back(index);
    };
    auto writer = [&]() -> streampump::runtime::task<void> {
        EXPECT_TRUE((co_await streampump::runtime::async_sleep(10ms)).has_value());
        EXPECT_TRUE(poke(pipes[2].write_end));
        EXPECT_TRUE((co_await streampump::runtime::async_sleep(10ms)).has_value());
        EXPECT_TRUE(poke(pipes[0].write_end));
        EXPECT_TRUE((co_await streampump::runtime::async_sleep(10ms)).has_value());
        stop.request_stop();
    };
    for (std::size_t i = 0; i < pipes.size(); ++i) {
        loop.spawn(reader(i));
    }
    loop.spawn(writer());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();

    EXPECT_EQ(woke, (std::vector<std::size_t>{2, 0, 1}));
    ASSERT_TRUE(outcomes[0].has_value() && outcomes[2].has_value());
    EXPECT_TRUE(outcomes[0]->has_value());
    EXPECT_TRUE(outcomes[2]->has_value());
    ASSERT_TRUE(outcomes[1].has_value());
    ASSERT_FALSE(outcomes[1]->has_value());
    EXPECT_TRUE(streampump::is_cancellation(outcomes[1]->error()));
    EXPECT_EQ(loop.active_tasks(), 0U);
}

TEST(runtime_coroutines_test, cancelled_read_loses_no_bytes) {
    streampump::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto listener_result = streampump::nonblocking::tcp_listener::bind(
        streampump::nonblocking::endpoint::loopback(0), 8);
    ASSERT_TRUE(listener_result.has_value()) << listener_result.error().message();
    auto listener = std::move(listener_result.value());
    auto port_result = listener.local_port();
    ASSERT_TRUE(port_result.has_value()) << port_result.error().message();

    std::optional<streampump::result<std::size_t>> cancelled_read;
    std::string relayed;

    auto server = [&]() -> streampump::runtime::task<void> {
        auto accepted = co_await streampump::runtime::async_accept(listener);
        if (!accepted.has_value()) {
            ADD_FAILURE() << accepted.error().message();
            co_return;
        }
        auto peer = std::move(accepted.value());
        std::array<std::byte, 64> chunk{};

        // One race round: the read loses to a 20ms timer and is cancelled.
        streampump::runtime::cancel_source round;
        auto expire = [&]() -> streampump::runtime::task<void> {
            EXPECT_TRUE((co_await streampump::runtime::async_sleep(20ms)).has_value());
            round.request_stop();
        };
        loop.spawn(expire());
        cancelled_read = co_await streampump::runtime::async_read_some(
            peer, std::span<std::byte>{chunk}, round.token());

        // The next round reads what the client sent in the meantime.
        std::size_t total = 0;
        while (total < 5) {
            auto read = co_await streampump::runtime::async_read_some(
                peer, std::span<std::byte>{chunk}.subspan(total));
            if (!read.has_value() || read.value() == 0) {
                ADD_FAILURE() << "read ended early";
                co_return;
            }
            total += read.value();
        }
        for (const auto byte : std::span<const std::byte>{chunk}.first(total)) {
            relayed.push_back(static_cast<char>(byte));
        }

        auto pending = std::span<const std::byte>{chunk}.first(total);
        while (!pending.empty()) {
            auto written = co_await streampump::runtime::async_write_some_with_timeout(
                peer, pending, 2s);
            if (!written.has_value()) {
                ADD_FAILURE() << written.error().message();
                co_return;
            }
            pending = pending.subspan(written.value());
        }
    };
    loop.spawn(server());

    auto client = std::async(std::launch::async, [port = port_result.value()]() {
        auto stream = streampump::blocking::tcp_stream::connect(
            streampump::blocking::endpoint::loopback(port));
        if (!stream.has_value()) {
            return streampump::err<void>(stream.error());
        }
        std::this_thread::sleep_for(60ms);
        const std::array<std::byte, 5> frame{std::byte{'f'}, std::byte{'r'}, std::byte{'a'},
                                             std::byte{'m'}, std::byte{'e'}};
        if (auto sent = streampump::blocking::write_all(*stream, frame); !sent.has_value()) {
            return sent;
        }
        std::array<std::byte, 5> echoed{};
        if (auto read = streampump::blocking::read_exact(*stream, echoed); !read.has_value()) {
            return read;
        }
        if (echoed != frame) {
            return streampump::err<void>(streampump::make_error_from_errno(EBADMSG));
        }
        return streampump::ok();
    });

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    const auto client_result = client.get();
    EXPECT_TRUE(client_result.has_value()) << client_result.error().message();

    ASSERT_TRUE(cancelled_read.has_value());
    ASSERT_FALSE(cancelled_read->has_value());
    EXPECT_TRUE(streampump::is_cancellation(cancelled_read->error()));
    EXPECT_EQ(relayed, "frame");
}

TEST(runtime_coroutines_test, wait_for_cancel_wakes_on_stop_request) {
    streampump::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    streampump::runtime::cancel_source source;
    std::optional<streampump::result<void>> waited;
    std::optional<streampump::result<void>> unstoppable;

    auto waiter = [&]() -> streampump::runtime::task<void> {
        unstoppable = co_await streampump::runtime::wait_for_cancel({});
        waited = co_await streampump::runtime::wait_for_cancel(source.token());
    };
    auto stopper = [&]() -> streampump::runtime::task<void> {
        const auto slept = co_await streampump::runtime::async_sleep(20ms);
        EXPECT_TRUE(slept.has_value());
        source.request_stop();
    };
    loop.spawn(waiter());
    loop.spawn(stopper());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();

    ASSERT_TRUE(unstoppable.has_value());
    ASSERT_FALSE(unstoppable->has_value());
    EXPECT_EQ(unstoppable->error().value(), EINVAL);

    ASSERT_TRUE(waited.has_value());
    ASSERT_FALSE(waited->has_value());
    EXPECT_EQ(waited->error().value(), ECANCELED);
}

} // namespace

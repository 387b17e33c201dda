#include "streampump/blocking/tcp.hpp"
#include "streampump/epoll/reactor.hpp"
#include "streampump/nonblocking/tcp.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <sys/epoll.h>
#include <thread>

namespace {

using namespace std::chrono_literals;

/// Waits for one client on a nonblocking listener.
streampump::result<streampump::nonblocking::tcp_stream>
accept_one(streampump::nonblocking::tcp_listener& listener) {
    auto reactor_result = streampump::epoll::reactor::create(1);
    if (!reactor_result.has_value()) {
        return streampump::err<streampump::nonblocking::tcp_stream>(
            reactor_result.error());
    }
    auto reactor = std::move(reactor_result.value());
    const auto added = reactor.add(listener.native_handle(), EPOLLIN);
    if (!added.has_value()) {
        return streampump::err<streampump::nonblocking::tcp_stream>(added.error());
    }

    const auto ready = reactor.wait(2s);
    if (!ready.has_value()) {
        return streampump::err<streampump::nonblocking::tcp_stream>(ready.error());
    }
    if (ready->empty()) {
        return streampump::err<streampump::nonblocking::tcp_stream>(
            streampump::make_error_from_errno(ETIMEDOUT));
    }
    return listener.accept();
}

class blocking_tcp_test : public ::testing::Test {
protected:
    void SetUp() override {
        auto listener_result = streampump::nonblocking::tcp_listener::bind(
            streampump::nonblocking::endpoint::loopback(0), 8);
        ASSERT_TRUE(listener_result.has_value()) << listener_result.error().message();
        listener_ = std::move(listener_result.value());

        auto port_result = listener_.local_port();
        ASSERT_TRUE(port_result.has_value()) << port_result.error().message();
        port_ = port_result.value();
    }

    streampump::nonblocking::tcp_listener listener_{};
    std::uint16_t port_{0};
};

TEST_F(blocking_tcp_test, write_all_and_read_exact_round_trip) {
    auto peer_future = std::async(std::launch::async, [this]() { return accept_one(listener_); });

    auto client_result = streampump::blocking::tcp_stream::connect(
        streampump::blocking::endpoint::loopback(port_));
    ASSERT_TRUE(client_result.has_value()) << client_result.error().message();
    auto client = std::move(client_result.value());

    auto peer_result = peer_future.get();
    ASSERT_TRUE(peer_result.has_value()) << peer_result.error().message();
    auto peer = std::move(peer_result.value());

    const std::array<std::byte, 5> request{std::byte{'f'}, std::byte{'r'}, std::byte{'a'},
                                           std::byte{'m'}, std::byte{'e'}};
    const auto write_status =
        streampump::blocking::write_all(client, std::span<const std::byte>{request});
    ASSERT_TRUE(write_status.has_value()) << write_status.error().message();

    std::array<std::byte, 5> received{};
    std::size_t total = 0;
    for (int attempt = 0; attempt < 200 && total < received.size(); ++attempt) {
        auto read = peer.read_some(std::span<std::byte>{received}.subspan(total));
        if (read.has_value()) {
            total += read.value();
            continue;
        }
        ASSERT_TRUE(streampump::nonblocking::is_would_block(read.error()));
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(total, received.size());
    EXPECT_EQ(received, request);

    ASSERT_TRUE(peer.write_some(std::span<const std::byte>{received}).has_value());
    std::array<std::byte, 5> echoed{};
    const auto read_status =
        streampump::blocking::read_exact(client, std::span<std::byte>{echoed});
    ASSERT_TRUE(read_status.has_value()) << read_status.error().message();
    EXPECT_EQ(echoed, request);
}

TEST_F(blocking_tcp_test, receive_timeout_and_peer_shutdown) {
    auto peer_future = std::async(std::launch::async, [this]() { return accept_one(listener_); });

    auto client_result = streampump::blocking::tcp_stream::connect(
        streampump::blocking::endpoint::loopback(port_));
    ASSERT_TRUE(client_result.has_value()) << client_result.error().message();
    auto client = std::move(client_result.value());
    ASSERT_TRUE(client.set_receive_timeout(50ms).has_value());

    auto peer_result = peer_future.get();
    ASSERT_TRUE(peer_result.has_value()) << peer_result.error().message();
    auto peer = std::move(peer_result.value());

    std::array<std::byte, 8> buffer{};
    const auto quiet = client.read_some(std::span<std::byte>{buffer});
    ASSERT_FALSE(quiet.has_value());
    EXPECT_TRUE(streampump::nonblocking::is_would_block(quiet.error()))
        << quiet.error().message();

    ASSERT_TRUE(peer.shutdown_write().has_value());
    const auto closed = client.read_some(std::span<std::byte>{buffer});
    ASSERT_TRUE(closed.has_value()) << closed.error().message();
    EXPECT_EQ(closed.value(), 0U);
}

TEST(endpoint_test, parses_host_and_port) {
    const auto parsed = streampump::blocking::endpoint::parse("10.0.0.7:8000");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
    EXPECT_EQ(parsed->host, "10.0.0.7");
    EXPECT_EQ(parsed->port, 8000);
    EXPECT_EQ(parsed->to_string(), "10.0.0.7:8000");

    for (const auto *bad : {"10.0.0.7", ":8000", "host:", "host:80x", "host:70000"}) {
        const auto rejected = streampump::blocking::endpoint::parse(bad);
        ASSERT_FALSE(rejected.has_value()) << bad;
        EXPECT_TRUE(rejected.error().is_errno(EINVAL)) << bad;
    }
}

TEST(endpoint_test, connect_rejects_non_literal_host) {
    const auto client =
        streampump::blocking::tcp_stream::connect({.host = "localhost", .port = 80});
    ASSERT_FALSE(client.has_value());
    EXPECT_TRUE(client.error().is_errno(EINVAL));
}

} // namespace

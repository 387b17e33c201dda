#pragma once

/**
 * @file
 * @brief Nonblocking TCP sockets driven by the event loop.
 */

#include "streampump/blocking/endpoint.hpp"
#include "streampump/core/result.hpp"
#include "streampump/core/unique_fd.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace streampump::nonblocking {

using endpoint = streampump::blocking::endpoint;

/**
 * @brief Connected socket in `O_NONBLOCK` mode.
 *
 * Reads and writes fail with `EAGAIN` instead of blocking; the runtime's
 * `async_*` operations wait for readiness and retry.
 */
class tcp_stream {
public:
    tcp_stream() noexcept = default;
    explicit tcp_stream(streampump::unique_fd fd) noexcept;

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;
    tcp_stream(tcp_stream&&) noexcept = default;
    tcp_stream& operator=(tcp_stream&&) noexcept = default;

    /// @return Bytes read; `0` once the peer shut down its side.
    [[nodiscard]] result<std::size_t> read_some(std::span<std::byte> buffer) noexcept;
    [[nodiscard]] result<std::size_t>
    write_some(std::span<const std::byte> buffer) noexcept;
    [[nodiscard]] result<void> shutdown_write() noexcept;
    /// @brief Release the descriptor now; the stream becomes invalid.
    void close() noexcept;

    [[nodiscard]] int native_handle() const noexcept;
    [[nodiscard]] bool valid() const noexcept;

private:
    streampump::unique_fd fd_{};
};

/// @brief Listening socket whose `accept()` never blocks.
class tcp_listener {
public:
    tcp_listener() noexcept = default;
    explicit tcp_listener(streampump::unique_fd fd) noexcept;

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;
    tcp_listener(tcp_listener&&) noexcept = default;
    tcp_listener& operator=(tcp_listener&&) noexcept = default;

    /**
     * @brief Bind with `SO_REUSEADDR` and start listening.
     * @param local Port `0` picks an ephemeral port, see `local_port()`.
     */
    [[nodiscard]] static result<tcp_listener> bind(const endpoint& local,
                                                   int backlog = 128) noexcept;
    /// @return A nonblocking stream, or `EAGAIN` when nobody is waiting.
    [[nodiscard]] result<tcp_stream> accept() noexcept;
    [[nodiscard]] result<std::uint16_t> local_port() const noexcept;

    [[nodiscard]] int native_handle() const noexcept;
    [[nodiscard]] bool valid() const noexcept;

private:
    streampump::unique_fd fd_{};
};

/// @return `true` for `EAGAIN` / `EWOULDBLOCK`.
[[nodiscard]] bool is_would_block(const streampump::error& err) noexcept;

} // namespace streampump::nonblocking

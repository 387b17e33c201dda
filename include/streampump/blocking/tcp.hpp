#pragma once

/**
 * @file
 * @brief Blocking TCP client socket for test peers and the flood client.
 */

#include "streampump/blocking/endpoint.hpp"
#include "streampump/core/result.hpp"
#include "streampump/core/unique_fd.hpp"

#include <chrono>
#include <cstddef>
#include <span>

namespace streampump::blocking {

class tcp_stream {
public:
    tcp_stream() noexcept = default;
    explicit tcp_stream(streampump::unique_fd fd) noexcept;

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;
    tcp_stream(tcp_stream&&) noexcept = default;
    tcp_stream& operator=(tcp_stream&&) noexcept = default;

    [[nodiscard]] static result<tcp_stream> connect(const endpoint& remote) noexcept;

    /// @return Bytes read; `0` once the peer shut down its side.
    [[nodiscard]] result<std::size_t> read_some(std::span<std::byte> buffer) noexcept;
    [[nodiscard]] result<std::size_t>
    write_some(std::span<const std::byte> buffer) noexcept;
    [[nodiscard]] result<void> shutdown_write() noexcept;

    /**
     * @brief Bound every later receive (`SO_RCVTIMEO`).
     *
     * A receive that runs out of time fails with `EAGAIN`.
     */
    [[nodiscard]] result<void>
    set_receive_timeout(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] int native_handle() const noexcept;
    [[nodiscard]] bool valid() const noexcept;

private:
    streampump::unique_fd fd_;
};

/// @brief Send all of `buffer`, looping over short writes.
[[nodiscard]] result<void> write_all(tcp_stream& stream,
                                     std::span<const std::byte> buffer) noexcept;

/**
 * @brief Fill all of `buffer`.
 * @return `ECONNRESET` when the peer shuts down first.
 */
[[nodiscard]] result<void> read_exact(tcp_stream& stream,
                                      std::span<std::byte> buffer) noexcept;

} // namespace streampump::blocking

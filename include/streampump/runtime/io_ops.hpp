#pragma once

/**
 * @file
 * @brief Coroutine-based async I/O and timer operations built on `scheduler`.
 *
 * Every operation that takes a `cancel_token` wakes up as soon as the token
 * is stopped and reports `ECANCELED`.
 */

#include "streampump/nonblocking/tcp.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/task.hpp"

#include <chrono>
#include <cstddef>
#include <span>

namespace streampump::runtime {

/// @brief Suspend until the descriptor is readable.
[[nodiscard]] task<result<void>> wait_readable(int fd, cancel_token token = {});
/// @brief Suspend until the descriptor is writable.
[[nodiscard]] task<result<void>> wait_writable(int fd, cancel_token token = {});
/// @brief Suspend until readable, timeout (`ETIMEDOUT`) or cancellation.
[[nodiscard]] task<result<void>>
wait_readable_for(int fd, std::chrono::milliseconds timeout,
                  cancel_token token = {});
/// @brief Suspend until writable, timeout (`ETIMEDOUT`) or cancellation.
[[nodiscard]] task<result<void>>
wait_writable_for(int fd, std::chrono::milliseconds timeout,
                  cancel_token token = {});

/**
 * @brief Asynchronous sleep with optional cancellation.
 * @param duration Sleep duration.
 * @param token Optional cancellation token.
 */
[[nodiscard]] task<result<void>> async_sleep(std::chrono::milliseconds duration,
                                             cancel_token token = {});

/**
 * @brief Suspend until `token` is stopped.
 * @return `ECANCELED` once stopped, `EINVAL` for a token that can never stop.
 */
[[nodiscard]] task<result<void>> wait_for_cancel(cancel_token token);

/// @brief Accept one TCP connection asynchronously.
[[nodiscard]] task<result<streampump::nonblocking::tcp_stream>>
async_accept(streampump::nonblocking::tcp_listener& listener,
             cancel_token token = {});

/// @brief Read available bytes from a stream asynchronously.
[[nodiscard]] task<result<std::size_t>>
async_read_some(streampump::nonblocking::tcp_stream& stream,
                std::span<std::byte> buffer, cancel_token token = {});

/**
 * @brief Write with timeout and optional cancellation.
 * @param stream Stream to write to.
 * @param buffer Source bytes.
 * @param timeout Timeout bound for the whole call.
 * @param token Optional cancellation token.
 */
[[nodiscard]] task<result<std::size_t>> async_write_some_with_timeout(
    streampump::nonblocking::tcp_stream& stream,
    std::span<const std::byte> buffer, std::chrono::milliseconds timeout,
    cancel_token token = {});

} // namespace streampump::runtime

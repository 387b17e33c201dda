#pragma once

/**
 * @file
 * @brief Pipeline-level error codes and failure classification.
 */

#include "streampump/core/error.hpp"

#include <string_view>
#include <system_error>
#include <type_traits>

namespace streampump {

/**
 * @brief Failure codes raised by the streaming pipeline itself.
 *
 * System failures keep their errno value; these cover conditions that have
 * no errno counterpart.
 */
enum class errc {
    /// Remote side closed the session (close frame or EOF).
    peer_closed = 1,
    /// Channel was closed and has no more queued items.
    channel_closed,
    /// Operation requires an open connection.
    connection_not_open,
    /// `accept()` was called on a connection that is already open.
    already_open,
    /// Transport-level opening handshake was malformed or refused.
    handshake_failed,
    /// Peer violated the framing protocol.
    protocol_violation,
    /// Inbound message exceeds the configured size limit.
    message_too_large,
    /// Predictor could not produce a result for a frame.
    model_failure,
    /// No endpoint is registered for the requested path.
    route_not_found,
    /// Endpoint handler raised an exception.
    handler_failure,
};

/// @return The singleton category for `errc` values.
[[nodiscard]] const std::error_category& errc_category() noexcept;

/// @brief Build a `std::error_code` for an `errc` value.
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/// @brief Build a library `error` for an `errc` value.
[[nodiscard]] error make_error(errc value) noexcept;

/// @return Short symbolic name, e.g. `"peer_closed"`.
[[nodiscard]] std::string_view to_string(errc value) noexcept;

/**
 * @brief Test whether an error means the peer went away.
 *
 * Covers `peer_closed`, `connection_not_open` and the errno values a socket
 * reports after the remote end disappeared.
 */
[[nodiscard]] bool is_disconnect(const error& err) noexcept;

/// @brief Test whether an error is the cooperative-cancellation signal.
[[nodiscard]] bool is_cancellation(const error& err) noexcept;

} // namespace streampump

template <>
struct std::is_error_code_enum<streampump::errc> : std::true_type {};

#pragma once

/**
 * @file
 * @brief Transport-neutral duplex session consumed by the pump.
 */

#include "streampump/pipeline/message.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/task.hpp"

#include <cstdint>
#include <string>

namespace streampump::pipeline {

/// @brief Close status codes understood by every transport (RFC 6455 values).
namespace close_code {
inline constexpr std::uint16_t normal = 1000;
inline constexpr std::uint16_t going_away = 1001;
inline constexpr std::uint16_t protocol_error = 1002;
inline constexpr std::uint16_t message_too_big = 1009;
inline constexpr std::uint16_t internal_error = 1011;
} // namespace close_code

/// @brief Per-connection data captured during the opening handshake.
struct connection_context {
    /// Request path used to select the endpoint, e.g. `/echo`.
    std::string path{};
    /// Value of the `username` query parameter.
    std::string username{"Anonymous"};
};

/**
 * @brief One live duplex transport session.
 *
 * One coroutine may be suspended in `receive()` while another is suspended
 * in `send()`. Concurrent `send()` calls must be serialized by the caller.
 */
class connection {
public:
    virtual ~connection() = default;

    /**
     * @brief Complete the transport handshake.
     * @return `errc::already_open` when called on an open connection.
     */
    [[nodiscard]] virtual runtime::task<result<void>>
    accept(runtime::cancel_token token) = 0;

    /**
     * @brief Suspend until the next complete message arrives.
     *
     * Cancellation never loses data: bytes of a partially received message
     * stay buffered for the next call.
     * @return The message, `errc::peer_closed` once the peer closed, or
     *         `ECANCELED`.
     */
    [[nodiscard]] virtual runtime::task<result<message>>
    receive(runtime::cancel_token token) = 0;

    /**
     * @brief Put one message on the wire.
     *
     * Not cancellable: a message is either sent entirely or the connection
     * fails. @return `errc::connection_not_open` when closed.
     */
    [[nodiscard]] virtual runtime::task<result<void>> send(message out) = 0;

    /// @brief Start the closing handshake and release the transport.
    /// No-op on a connection that is not open.
    [[nodiscard]] virtual runtime::task<result<void>>
    close(std::uint16_t code, std::string reason) = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t id() const noexcept = 0;
    [[nodiscard]] virtual const connection_context& context() const noexcept = 0;
};

} // namespace streampump::pipeline

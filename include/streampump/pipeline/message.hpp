#pragma once

/**
 * @file
 * @brief Opaque unit of data moved through a duplex pump.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace streampump::pipeline {

/// @brief How the transport framed the payload.
enum class message_kind {
    text,
    binary,
};

/**
 * @brief One inbound frame or outbound result.
 *
 * The pump never looks into `payload`; it only moves messages between the
 * connection, the channel and the predictor.
 */
struct message {
    message_kind kind{message_kind::binary};
    std::vector<std::byte> payload{};
    /// Arrival order on the receiving connection, starting at 1. Zero for
    /// messages that did not come from a connection.
    std::uint64_t sequence{0};

    /// @brief Build a text message from UTF-8 bytes.
    [[nodiscard]] static message text(std::string_view body);
    /// @brief Build a binary message by copying `body`.
    [[nodiscard]] static message binary(std::span<const std::byte> body);

    /// @return Payload viewed as characters, regardless of `kind`.
    [[nodiscard]] std::string_view as_text() const noexcept;
    /// @return Payload copied into a string.
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] bool is_text() const noexcept {
        return kind == message_kind::text;
    }
};

} // namespace streampump::pipeline

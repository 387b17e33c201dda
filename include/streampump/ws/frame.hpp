#pragma once

/**
 * @file
 * @brief RFC 6455 frame encoding, incremental decoding and reassembly.
 */

#include "streampump/core/result.hpp"
#include "streampump/pipeline/message.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace streampump::ws {

/// @brief Frame opcodes defined by RFC 6455.
enum class opcode : std::uint8_t {
    continuation = 0x0,
    text = 0x1,
    binary = 0x2,
    close = 0x8,
    ping = 0x9,
    pong = 0xA,
};

/// @return `true` for close, ping and pong.
[[nodiscard]] constexpr bool is_control(opcode op) noexcept {
    return (static_cast<std::uint8_t>(op) & 0x8U) != 0;
}

/// @brief One decoded frame with its payload already unmasked.
struct frame {
    bool fin{true};
    opcode op{opcode::binary};
    std::vector<std::byte> payload{};
};

/**
 * @brief Encode one frame.
 * @param op Opcode.
 * @param payload Application data.
 * @param mask Masking key; clients must mask, servers must not.
 * @param fin Final fragment flag.
 */
[[nodiscard]] std::vector<std::byte>
encode_frame(opcode op, std::span<const std::byte> payload,
             std::optional<std::array<std::byte, 4>> mask = std::nullopt,
             bool fin = true);

/// @brief Payload of a close frame: 2-byte status code plus UTF-8 reason.
[[nodiscard]] std::vector<std::byte> encode_close_payload(std::uint16_t code,
                                                          std::string_view reason);

/// @return Status code carried by a close payload, `1005` when absent.
[[nodiscard]] std::uint16_t decode_close_code(std::span<const std::byte> payload) noexcept;

/// @brief Limits and role enforced while decoding.
struct decode_limits {
    /// Largest accepted message after reassembly.
    std::size_t max_message_bytes{16U * 1024U * 1024U};
    /// Server side: every inbound frame must be masked.
    bool require_masked{true};
};

/**
 * @brief Incremental decoder that turns a byte stream into messages.
 *
 * Data frames are reassembled across continuation frames. Control frames
 * may arrive between fragments and are returned as they come.
 */
class frame_decoder {
public:
    explicit frame_decoder(decode_limits limits = {}) noexcept;

    /// @brief Append received bytes.
    void feed(std::span<const std::byte> bytes);

    /// @brief Item produced by `next()`.
    struct event {
        /// Control frame (close, ping, pong), if that is what arrived.
        std::optional<frame> control{};
        /// Complete data message, if that is what arrived.
        std::optional<pipeline::message> data{};
    };

    /**
     * @brief Decode the next control frame or complete data message.
     * @return `std::nullopt` when more bytes are needed;
     *         `errc::protocol_violation` or `errc::message_too_large` when
     *         the stream is invalid. The decoder is unusable after an error.
     */
    [[nodiscard]] result<std::optional<event>> next();

    /// @return Bytes received but not decoded yet.
    [[nodiscard]] std::size_t buffered() const noexcept;

private:
    [[nodiscard]] result<std::optional<frame>> next_frame();

    decode_limits limits_{};
    std::vector<std::byte> buffer_{};
    std::size_t offset_{0};
    std::optional<opcode> partial_op_{};
    std::vector<std::byte> partial_{};
};

} // namespace streampump::ws

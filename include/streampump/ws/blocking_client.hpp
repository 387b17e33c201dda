#pragma once

/**
 * @file
 * @brief Minimal blocking WebSocket client for tools and tests.
 */

#include "streampump/blocking/tcp.hpp"
#include "streampump/pipeline/message.hpp"
#include "streampump/ws/frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace streampump::ws {

/**
 * @brief Client end of a WebSocket session on a blocking socket.
 *
 * Frames are masked as RFC 6455 requires of clients. Every read is bounded
 * by the receive timeout given to `connect()`.
 */
class blocking_client {
public:
    blocking_client() = default;
    blocking_client(blocking_client&&) noexcept = default;
    blocking_client& operator=(blocking_client&&) noexcept = default;

    /**
     * @brief Connect and perform the opening handshake.
     * @param server Server address.
     * @param target Request target, e.g. `/echo?username=ann`.
     * @param timeout Receive timeout for every later read.
     * @return `errc::handshake_failed` when the server refused the upgrade.
     */
    [[nodiscard]] static result<blocking_client>
    connect(const blocking::endpoint& server, std::string_view target,
            std::chrono::milliseconds timeout = std::chrono::seconds{5});

    [[nodiscard]] result<void> send_text(std::string_view text);
    [[nodiscard]] result<void> send_binary(std::span<const std::byte> data);
    [[nodiscard]] result<void> send_ping(std::span<const std::byte> data = {});

    /**
     * @brief Block until the next data message.
     *
     * Pings are answered, pongs skipped. A close frame from the server is
     * echoed and reported as `errc::peer_closed`.
     */
    [[nodiscard]] result<pipeline::message> receive();

    /**
     * @brief Send a close frame and wait for the server's reply or EOF.
     *
     * Data arriving in between is discarded.
     */
    [[nodiscard]] result<void> close(std::uint16_t code = 1000,
                                     std::string_view reason = {});

    /// @return Code of the close frame the server sent, `0` if none yet.
    [[nodiscard]] std::uint16_t server_close_code() const noexcept;
    [[nodiscard]] bool is_open() const noexcept;

private:
    explicit blocking_client(blocking::tcp_stream stream);

    [[nodiscard]] result<void> write_frame(opcode op,
                                           std::span<const std::byte> payload);
    [[nodiscard]] result<std::size_t> fill();

    blocking::tcp_stream stream_{};
    frame_decoder decoder_{decode_limits{16U * 1024U * 1024U, false}};
    std::vector<std::byte> read_buffer_{};
    bool close_sent_{false};
    bool closed_{false};
    std::uint16_t server_close_code_{0};
};

} // namespace streampump::ws

#pragma once

/**
 * @file
 * @brief Server-side WebSocket connection over a non-blocking TCP stream.
 */

#include "streampump/nonblocking/tcp.hpp"
#include "streampump/pipeline/connection.hpp"
#include "streampump/ws/frame.hpp"
#include "streampump/ws/frame_writer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace streampump::ws {

/// @brief Bounds applied to one connection.
struct connection_limits {
    decode_limits decode{};
    writer_limits writer{};
    /// Time allowed for the client to send its upgrade request.
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds{5}};
    /// Time `close()` waits for the peer to finish the closing handshake.
    std::chrono::milliseconds close_timeout{std::chrono::seconds{1}};
};

/// @brief Decides whether a request path is served; `false` answers 404.
using path_filter = std::function<bool(std::string_view path)>;

/**
 * @brief `pipeline::connection` speaking RFC 6455 as the server.
 *
 * Pings are answered and a peer's close frame is echoed from inside
 * `receive()`. Outbound frames go through one `frame_writer`, so a pong
 * never splits a data frame.
 */
class ws_connection final : public pipeline::connection {
public:
    /**
     * @param stream Accepted socket.
     * @param id Identifier reported in pump reports.
     * @param limits Size and time bounds.
     * @param accepts Path filter; empty accepts every path.
     */
    ws_connection(streampump::nonblocking::tcp_stream stream, std::uint64_t id,
                  connection_limits limits = {}, path_filter accepts = {});

    ws_connection(const ws_connection&) = delete;
    ws_connection& operator=(const ws_connection&) = delete;
    ws_connection(ws_connection&&) = delete;
    ws_connection& operator=(ws_connection&&) = delete;

    /**
     * @brief Read and answer the upgrade request.
     * @return `errc::handshake_failed` (answered 400),
     *         `errc::route_not_found` (answered 404), `ETIMEDOUT`, or
     *         `errc::peer_closed` when the client left first.
     */
    [[nodiscard]] runtime::task<result<void>>
    accept(runtime::cancel_token token) override;
    [[nodiscard]] runtime::task<result<pipeline::message>>
    receive(runtime::cancel_token token) override;
    [[nodiscard]] runtime::task<result<void>>
    send(pipeline::message out) override;
    [[nodiscard]] runtime::task<result<void>>
    close(std::uint16_t code, std::string reason) override;

    [[nodiscard]] bool is_open() const noexcept override;
    [[nodiscard]] std::uint64_t id() const noexcept override;
    [[nodiscard]] const pipeline::connection_context&
    context() const noexcept override;

    /// @return Close code the peer sent, or `0` when it sent none.
    [[nodiscard]] std::uint16_t peer_close_code() const noexcept;

private:
    enum class phase {
        handshake,
        open,
        closed,
    };

    runtime::task<result<void>> write_control(opcode op,
                                              std::vector<std::byte> payload);
    runtime::task<result<void>> reject(int status, std::string_view reason);
    runtime::task<void> linger();
    void release() noexcept;

    streampump::nonblocking::tcp_stream stream_;
    std::uint64_t id_{0};
    connection_limits limits_{};
    path_filter accepts_{};
    frame_writer writer_;
    frame_decoder decoder_;
    pipeline::connection_context context_{};
    phase phase_{phase::handshake};
    bool close_sent_{false};
    bool peer_closed_{false};
    std::uint16_t peer_close_code_{0};
    std::uint64_t next_sequence_{1};
    std::vector<std::byte> read_buffer_;
};

} // namespace streampump::ws

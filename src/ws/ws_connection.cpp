#include "streampump/ws/ws_connection.hpp"

#include "streampump/core/errc.hpp"
#include "streampump/runtime/io_ops.hpp"
#include "streampump/ws/handshake.hpp"

#include <span>
#include <utility>

namespace {

constexpr std::size_t kReadChunk = 16U * 1024U;

[[nodiscard]] std::vector<std::byte> to_bytes(std::string_view text) {
    const auto *first = reinterpret_cast<const std::byte *>(text.data());
    return std::vector<std::byte>(first, first + text.size());
}

} // namespace

namespace streampump::ws {

ws_connection::ws_connection(streampump::nonblocking::tcp_stream stream,
                             std::uint64_t id, connection_limits limits,
                             path_filter accepts)
    : stream_(std::move(stream)), id_(id), limits_(limits),
      accepts_(std::move(accepts)), writer_(stream_, limits.writer),
      decoder_(limits.decode), read_buffer_(kReadChunk) {}

runtime::task<result<void>> ws_connection::accept(runtime::cancel_token token) {
    if (phase_ == phase::open) {
        co_return err<void>(errc::already_open);
    }
    if (phase_ == phase::closed || !stream_.valid()) {
        co_return err<void>(errc::connection_not_open);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + limits_.handshake_timeout;
    std::string head;
    std::size_t header_end = 0;
    while ((header_end = find_header_end(head)) == 0) {
        if (head.size() > kMaxHandshakeBytes) {
            const auto rejected = co_await reject(400, "Bad Request");
            if (!rejected.has_value()) {
                co_return rejected;
            }
            co_return err<void>(errc::handshake_failed);
        }

        auto read_result = stream_.read_some(read_buffer_);
        if (read_result.has_value()) {
            if (read_result.value() == 0U) {
                release();
                co_return err<void>(errc::peer_closed);
            }
            head.append(reinterpret_cast<const char *>(read_buffer_.data()),
                        read_result.value());
            continue;
        }
        if (!streampump::nonblocking::is_would_block(read_result.error())) {
            release();
            co_return err<void>(read_result.error());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            release();
            co_return err<void>(make_error_from_errno(ETIMEDOUT));
        }
        const auto ready = co_await runtime::wait_readable_for(
            stream_.native_handle(),
            std::chrono::ceil<std::chrono::milliseconds>(deadline - now), token);
        if (!ready.has_value()) {
            release();
            co_return ready;
        }
    }

    // A client may pipeline its first frames behind the request.
    if (head.size() > header_end) {
        decoder_.feed(std::as_bytes(
            std::span<const char>{head}.subspan(header_end)));
    }

    const auto request =
        parse_handshake_request(std::string_view{head}.substr(0, header_end));
    if (!request.has_value()) {
        const auto rejected = co_await reject(400, "Bad Request");
        if (!rejected.has_value()) {
            co_return rejected;
        }
        co_return err<void>(request.error());
    }
    if (accepts_ && !accepts_(request->path)) {
        const auto rejected = co_await reject(404, "Not Found");
        if (!rejected.has_value()) {
            co_return rejected;
        }
        co_return err<void>(errc::route_not_found);
    }

    const auto queued = writer_.enqueue(to_bytes(build_accept_response(*request)));
    if (!queued.has_value()) {
        release();
        co_return queued;
    }
    const auto flushed = co_await writer_.flush();
    if (!flushed.has_value()) {
        release();
        co_return flushed;
    }

    context_ = make_context(*request);
    phase_ = phase::open;
    co_return ok();
}

runtime::task<result<pipeline::message>>
ws_connection::receive(runtime::cancel_token token) {
    if (!is_open()) {
        co_return err<pipeline::message>(make_error(
            peer_closed_ ? errc::peer_closed : errc::connection_not_open));
    }

    while (true) {
        auto decoded = decoder_.next();
        if (!decoded.has_value()) {
            co_return err<pipeline::message>(decoded.error());
        }

        if (decoded->has_value()) {
            auto& item = **decoded;
            if (item.data.has_value()) {
                item.data->sequence = next_sequence_++;
                co_return std::move(*item.data);
            }

            auto& control = *item.control;
            if (control.op == opcode::ping) {
                const auto answered =
                    co_await write_control(opcode::pong, std::move(control.payload));
                if (!answered.has_value()) {
                    co_return err<pipeline::message>(answered.error());
                }
            } else if (control.op == opcode::close) {
                peer_closed_ = true;
                peer_close_code_ = decode_close_code(control.payload);
                if (!close_sent_) {
                    close_sent_ = true;
                    std::vector<std::byte> reply;
                    if (!control.payload.empty()) {
                        reply = encode_close_payload(peer_close_code_, {});
                    }
                    const auto echoed =
                        co_await write_control(opcode::close, std::move(reply));
                    if (!echoed.has_value()) {
                        co_return err<pipeline::message>(echoed.error());
                    }
                }
                co_return err<pipeline::message>(errc::peer_closed);
            }
            continue;
        }

        const auto read_result =
            co_await runtime::async_read_some(stream_, read_buffer_, token);
        if (!read_result.has_value()) {
            co_return err<pipeline::message>(read_result.error());
        }
        if (read_result.value() == 0U) {
            peer_closed_ = true;
            co_return err<pipeline::message>(errc::peer_closed);
        }
        decoder_.feed(std::span<const std::byte>{read_buffer_}.first(
            read_result.value()));
    }
}

runtime::task<result<void>> ws_connection::send(pipeline::message out) {
    if (!is_open()) {
        co_return err<void>(errc::connection_not_open);
    }

    const auto queued = writer_.enqueue(encode_frame(
        out.is_text() ? opcode::text : opcode::binary, out.payload));
    if (!queued.has_value()) {
        co_return queued;
    }
    co_return co_await writer_.flush();
}

runtime::task<result<void>> ws_connection::close(std::uint16_t code,
                                                 std::string reason) {
    if (phase_ == phase::closed) {
        co_return ok();
    }

    result<void> status = ok();
    if (phase_ == phase::open && !peer_closed_ && !close_sent_) {
        close_sent_ = true;
        status = co_await write_control(opcode::close,
                                        encode_close_payload(code, reason));
        if (status.has_value()) {
            co_await linger();
        }
    }

    release();
    co_return status;
}

bool ws_connection::is_open() const noexcept {
    return phase_ == phase::open && !peer_closed_;
}

std::uint64_t ws_connection::id() const noexcept {
    return id_;
}

const pipeline::connection_context& ws_connection::context() const noexcept {
    return context_;
}

std::uint16_t ws_connection::peer_close_code() const noexcept {
    return peer_close_code_;
}

runtime::task<result<void>>
ws_connection::write_control(opcode op, std::vector<std::byte> payload) {
    const auto queued = writer_.enqueue(encode_frame(op, payload));
    if (!queued.has_value()) {
        co_return queued;
    }
    co_return co_await writer_.flush();
}

runtime::task<result<void>> ws_connection::reject(int status,
                                                  std::string_view reason) {
    auto response = to_bytes(build_reject_response(status, reason));
    auto outcome = writer_.enqueue(std::move(response));
    if (outcome.has_value()) {
        outcome = co_await writer_.flush();
    }
    release();
    co_return outcome;
}

runtime::task<void> ws_connection::linger() {
    // Wait for the peer's close frame or EOF so unread input does not turn
    // our FIN into a reset.
    if (!stream_.shutdown_write().has_value()) {
        co_return;
    }

    const auto deadline =
        std::chrono::steady_clock::now() + limits_.close_timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            co_return;
        }
        const auto ready = co_await runtime::wait_readable_for(
            stream_.native_handle(),
            std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
        if (!ready.has_value()) {
            co_return;
        }

        const auto read_result = stream_.read_some(read_buffer_);
        if (read_result.has_value() && read_result.value() == 0U) {
            co_return;
        }
        if (!read_result.has_value() &&
            !streampump::nonblocking::is_would_block(read_result.error())) {
            co_return;
        }
    }
}

void ws_connection::release() noexcept {
    phase_ = phase::closed;
    stream_.close();
}

} // namespace streampump::ws

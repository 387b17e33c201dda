#include "streampump/ws/blocking_client.hpp"

#include "streampump/core/errc.hpp"
#include "streampump/ws/handshake.hpp"

#include <openssl/rand.h>

#include <array>
#include <cerrno>
#include <string>
#include <utility>

namespace {

constexpr std::size_t kReadChunk = 16U * 1024U;

[[nodiscard]] streampump::result<std::array<std::byte, 4>> random_mask() {
    std::array<unsigned char, 4> raw{};
    if (::RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return streampump::err<std::array<std::byte, 4>>(
            streampump::make_error_from_errno(EIO));
    }
    std::array<std::byte, 4> mask{};
    for (std::size_t i = 0; i < raw.size(); ++i) {
        mask[i] = std::byte{raw[i]};
    }
    return mask;
}

} // namespace

namespace streampump::ws {

blocking_client::blocking_client(blocking::tcp_stream stream)
    : stream_(std::move(stream)), read_buffer_(kReadChunk) {}

result<blocking_client>
blocking_client::connect(const blocking::endpoint& server,
                         std::string_view target,
                         std::chrono::milliseconds timeout) {
    auto stream = blocking::tcp_stream::connect(server);
    if (!stream.has_value()) {
        return err<blocking_client>(stream.error());
    }
    auto timeout_set = stream->set_receive_timeout(timeout);
    if (!timeout_set.has_value()) {
        return err<blocking_client>(timeout_set.error());
    }

    auto key = generate_client_key();
    if (!key.has_value()) {
        return err<blocking_client>(key.error());
    }

    blocking_client client{std::move(stream.value())};
    const auto request = build_client_request(server.to_string(), target, *key);
    auto written = blocking::write_all(
        client.stream_, std::as_bytes(std::span<const char>{request}));
    if (!written.has_value()) {
        return err<blocking_client>(written.error());
    }

    std::string head;
    std::size_t header_end = 0;
    while ((header_end = find_header_end(head)) == 0) {
        if (head.size() > kMaxHandshakeBytes) {
            return err<blocking_client>(errc::handshake_failed);
        }
        auto read_result = client.fill();
        if (!read_result.has_value()) {
            return err<blocking_client>(read_result.error());
        }
        head.append(reinterpret_cast<const char *>(client.read_buffer_.data()),
                    read_result.value());
    }

    auto accepted =
        validate_accept_response(std::string_view{head}.substr(0, header_end), *key);
    if (!accepted.has_value()) {
        return err<blocking_client>(accepted.error());
    }
    if (head.size() > header_end) {
        client.decoder_.feed(
            std::as_bytes(std::span<const char>{head}.subspan(header_end)));
    }
    return client;
}

result<void> blocking_client::send_text(std::string_view text) {
    return write_frame(opcode::text, std::as_bytes(std::span<const char>{text}));
}

result<void> blocking_client::send_binary(std::span<const std::byte> data) {
    return write_frame(opcode::binary, data);
}

result<void> blocking_client::send_ping(std::span<const std::byte> data) {
    return write_frame(opcode::ping, data);
}

result<pipeline::message> blocking_client::receive() {
    if (closed_) {
        return err<pipeline::message>(errc::peer_closed);
    }

    while (true) {
        auto decoded = decoder_.next();
        if (!decoded.has_value()) {
            return err<pipeline::message>(decoded.error());
        }

        if (decoded->has_value()) {
            auto& item = **decoded;
            if (item.data.has_value()) {
                return std::move(*item.data);
            }

            const auto& control = *item.control;
            if (control.op == opcode::ping) {
                auto answered = write_frame(opcode::pong, control.payload);
                if (!answered.has_value()) {
                    return err<pipeline::message>(answered.error());
                }
            } else if (control.op == opcode::close) {
                closed_ = true;
                server_close_code_ = decode_close_code(control.payload);
                if (!close_sent_) {
                    auto echoed = write_frame(
                        opcode::close, encode_close_payload(server_close_code_, {}));
                    if (!echoed.has_value()) {
                        return err<pipeline::message>(echoed.error());
                    }
                }
                return err<pipeline::message>(errc::peer_closed);
            }
            continue;
        }

        auto read_result = fill();
        if (!read_result.has_value()) {
            return err<pipeline::message>(read_result.error());
        }
        decoder_.feed(std::span<const std::byte>{read_buffer_}.first(
            read_result.value()));
    }
}

result<void> blocking_client::close(std::uint16_t code, std::string_view reason) {
    if (!stream_.valid() || closed_) {
        return ok();
    }

    auto sent = write_frame(opcode::close, encode_close_payload(code, reason));
    if (!sent.has_value()) {
        return sent;
    }

    while (!closed_) {
        auto drained = receive();
        if (drained.has_value()) {
            continue;
        }
        if (drained.error().is(errc::peer_closed)) {
            break;
        }
        return err<void>(drained.error());
    }
    stream_ = blocking::tcp_stream{};
    return ok();
}

std::uint16_t blocking_client::server_close_code() const noexcept {
    return server_close_code_;
}

bool blocking_client::is_open() const noexcept {
    return stream_.valid() && !closed_;
}

result<void> blocking_client::write_frame(opcode op,
                                          std::span<const std::byte> payload) {
    auto mask = random_mask();
    if (!mask.has_value()) {
        return err<void>(mask.error());
    }
    if (op == opcode::close) {
        close_sent_ = true;
    }
    const auto encoded = encode_frame(op, payload, *mask);
    return blocking::write_all(stream_, encoded);
}

result<std::size_t> blocking_client::fill() {
    auto read_result = stream_.read_some(read_buffer_);
    if (!read_result.has_value()) {
        return read_result;
    }
    if (read_result.value() == 0U) {
        closed_ = true;
        return err<std::size_t>(errc::peer_closed);
    }
    return read_result;
}

} // namespace streampump::ws

#include "streampump/ws/frame.hpp"

#include "streampump/core/errc.hpp"

#include <algorithm>
#include <utility>

namespace {

constexpr std::uint8_t kFinBit = 0x80;
constexpr std::uint8_t kReservedBits = 0x70;
constexpr std::uint8_t kOpcodeMask = 0x0F;
constexpr std::uint8_t kMaskBit = 0x80;
constexpr std::uint8_t kLengthMask = 0x7F;
constexpr std::size_t kMaxControlPayload = 125;
constexpr std::uint16_t kNoStatusCode = 1005;

[[nodiscard]] bool is_known_opcode(std::uint8_t value) noexcept {
    switch (value) {
    case 0x0:
    case 0x1:
    case 0x2:
    case 0x8:
    case 0x9:
    case 0xA:
        return true;
    default:
        return false;
    }
}

template <class T>
[[nodiscard]] streampump::result<T> protocol_error() {
    return streampump::err<T>(streampump::errc::protocol_violation);
}

} // namespace

namespace streampump::ws {

std::vector<std::byte>
encode_frame(opcode op, std::span<const std::byte> payload,
             std::optional<std::array<std::byte, 4>> mask, bool fin) {
    std::vector<std::byte> out;
    out.reserve(payload.size() + 14);

    out.push_back(std::byte{static_cast<std::uint8_t>(
        (fin ? kFinBit : 0U) | static_cast<std::uint8_t>(op))});

    const std::uint8_t mask_flag = mask.has_value() ? kMaskBit : 0U;
    const auto size = payload.size();
    if (size < 126) {
        out.push_back(std::byte{static_cast<std::uint8_t>(mask_flag | size)});
    } else if (size <= 0xFFFF) {
        out.push_back(std::byte{static_cast<std::uint8_t>(mask_flag | 126U)});
        out.push_back(std::byte{static_cast<std::uint8_t>(size >> 8)});
        out.push_back(std::byte{static_cast<std::uint8_t>(size)});
    } else {
        out.push_back(std::byte{static_cast<std::uint8_t>(mask_flag | 127U)});
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(std::byte{static_cast<std::uint8_t>(
                static_cast<std::uint64_t>(size) >> shift)});
        }
    }

    if (!mask.has_value()) {
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    out.insert(out.end(), mask->begin(), mask->end());
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(payload[i] ^ (*mask)[i % 4]);
    }
    return out;
}

std::vector<std::byte> encode_close_payload(std::uint16_t code,
                                            std::string_view reason) {
    const auto kept = reason.substr(0, kMaxControlPayload - 2);
    std::vector<std::byte> out;
    out.reserve(2 + kept.size());
    out.push_back(std::byte{static_cast<std::uint8_t>(code >> 8)});
    out.push_back(std::byte{static_cast<std::uint8_t>(code)});
    for (const char c : kept) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

std::uint16_t decode_close_code(std::span<const std::byte> payload) noexcept {
    if (payload.size() < 2) {
        return kNoStatusCode;
    }
    return static_cast<std::uint16_t>(
        (std::to_integer<std::uint16_t>(payload[0]) << 8) |
        std::to_integer<std::uint16_t>(payload[1]));
}

frame_decoder::frame_decoder(decode_limits limits) noexcept : limits_(limits) {}

void frame_decoder::feed(std::span<const std::byte> bytes) {
    if (offset_ > 0) {
        buffer_.erase(buffer_.begin(),
                      buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
        offset_ = 0;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::size_t frame_decoder::buffered() const noexcept {
    return buffer_.size() - offset_;
}

result<std::optional<frame>> frame_decoder::next_frame() {
    const auto available = std::span<const std::byte>{buffer_}.subspan(offset_);
    if (available.size() < 2) {
        return std::optional<frame>{};
    }

    const auto b0 = std::to_integer<std::uint8_t>(available[0]);
    const auto b1 = std::to_integer<std::uint8_t>(available[1]);
    if ((b0 & kReservedBits) != 0 || !is_known_opcode(b0 & kOpcodeMask)) {
        return protocol_error<std::optional<frame>>();
    }

    const bool masked = (b1 & kMaskBit) != 0;
    if (masked != limits_.require_masked) {
        return protocol_error<std::optional<frame>>();
    }

    frame out{};
    out.fin = (b0 & kFinBit) != 0;
    out.op = static_cast<opcode>(b0 & kOpcodeMask);

    std::size_t header = 2;
    std::uint64_t length = b1 & kLengthMask;
    if (length == 126) {
        if (available.size() < 4) {
            return std::optional<frame>{};
        }
        length = (std::to_integer<std::uint64_t>(available[2]) << 8) |
                 std::to_integer<std::uint64_t>(available[3]);
        header = 4;
    } else if (length == 127) {
        if (available.size() < 10) {
            return std::optional<frame>{};
        }
        length = 0;
        for (std::size_t i = 2; i < 10; ++i) {
            length = (length << 8) | std::to_integer<std::uint64_t>(available[i]);
        }
        if ((length >> 63) != 0) {
            return protocol_error<std::optional<frame>>();
        }
        header = 10;
    }

    if (is_control(out.op) && (!out.fin || length > kMaxControlPayload)) {
        return protocol_error<std::optional<frame>>();
    }
    if (!is_control(out.op) &&
        length + partial_.size() > limits_.max_message_bytes) {
        return err<std::optional<frame>>(errc::message_too_large);
    }

    std::array<std::byte, 4> mask{};
    if (masked) {
        if (available.size() < header + 4) {
            return std::optional<frame>{};
        }
        std::copy_n(available.begin() + static_cast<std::ptrdiff_t>(header), 4,
                    mask.begin());
        header += 4;
    }

    if (available.size() - header < length) {
        return std::optional<frame>{};
    }

    const auto body = available.subspan(header, static_cast<std::size_t>(length));
    out.payload.assign(body.begin(), body.end());
    if (masked) {
        for (std::size_t i = 0; i < out.payload.size(); ++i) {
            out.payload[i] ^= mask[i % 4];
        }
    }

    offset_ += header + static_cast<std::size_t>(length);
    return std::optional<frame>{std::move(out)};
}

result<std::optional<frame_decoder::event>> frame_decoder::next() {
    while (true) {
        auto decoded = next_frame();
        if (!decoded.has_value()) {
            return err<std::optional<event>>(decoded.error());
        }
        if (!decoded->has_value()) {
            return std::optional<event>{};
        }

        auto current = std::move(**decoded);
        if (is_control(current.op)) {
            return std::optional<event>{event{std::move(current), std::nullopt}};
        }

        if (current.op == opcode::continuation) {
            if (!partial_op_.has_value()) {
                return protocol_error<std::optional<event>>();
            }
            partial_.insert(partial_.end(), current.payload.begin(),
                            current.payload.end());
        } else {
            if (partial_op_.has_value()) {
                return protocol_error<std::optional<event>>();
            }
            partial_op_ = current.op;
            partial_ = std::move(current.payload);
        }

        if (!current.fin) {
            continue;
        }

        pipeline::message assembled{};
        assembled.kind = *partial_op_ == opcode::text
                             ? pipeline::message_kind::text
                             : pipeline::message_kind::binary;
        assembled.payload = std::exchange(partial_, {});
        partial_op_.reset();
        return std::optional<event>{event{std::nullopt, std::move(assembled)}};
    }
}

} // namespace streampump::ws

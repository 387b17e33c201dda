#include "streampump/pipeline/message.hpp"

namespace streampump::pipeline {

message message::text(std::string_view body) {
    message out{};
    out.kind = message_kind::text;
    const auto *first = reinterpret_cast<const std::byte *>(body.data());
    out.payload.assign(first, first + body.size());
    return out;
}

message message::binary(std::span<const std::byte> body) {
    message out{};
    out.kind = message_kind::binary;
    out.payload.assign(body.begin(), body.end());
    return out;
}

std::string_view message::as_text() const noexcept {
    return std::string_view{reinterpret_cast<const char *>(payload.data()),
                            payload.size()};
}

std::string message::to_string() const {
    return std::string{as_text()};
}

} // namespace streampump::pipeline

#include "streampump/core/errc.hpp"

#include <cerrno>
#include <string>

namespace streampump {

namespace {

class errc_category_impl final : public std::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override {
        return "streampump";
    }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::peer_closed:
            return "peer closed the connection";
        case errc::channel_closed:
            return "channel closed";
        case errc::connection_not_open:
            return "connection is not open";
        case errc::already_open:
            return "connection is already open";
        case errc::handshake_failed:
            return "opening handshake failed";
        case errc::protocol_violation:
            return "protocol violation";
        case errc::message_too_large:
            return "message too large";
        case errc::model_failure:
            return "predictor failed to process frame";
        case errc::route_not_found:
            return "no endpoint for requested path";
        case errc::handler_failure:
            return "endpoint handler raised an exception";
        }
        return "unknown streampump error";
    }
};

} // namespace

const std::error_category& errc_category() noexcept {
    static const errc_category_impl category{};
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), errc_category()};
}

error make_error(errc value) noexcept {
    return error{make_error_code(value)};
}

std::string_view to_string(errc value) noexcept {
    switch (value) {
    case errc::peer_closed:
        return "peer_closed";
    case errc::channel_closed:
        return "channel_closed";
    case errc::connection_not_open:
        return "connection_not_open";
    case errc::already_open:
        return "already_open";
    case errc::handshake_failed:
        return "handshake_failed";
    case errc::protocol_violation:
        return "protocol_violation";
    case errc::message_too_large:
        return "message_too_large";
    case errc::model_failure:
        return "model_failure";
    case errc::route_not_found:
        return "route_not_found";
    case errc::handler_failure:
        return "handler_failure";
    }
    return "unknown";
}

bool is_disconnect(const error& err) noexcept {
    if (err.is(errc::peer_closed) || err.is(errc::connection_not_open)) {
        return true;
    }
    return err.is_errno(ECONNRESET) || err.is_errno(EPIPE) ||
           err.is_errno(ENOTCONN) || err.is_errno(ECONNABORTED);
}

bool is_cancellation(const error& err) noexcept {
    return err.is_errno(ECANCELED);
}

} // namespace streampump

#include "streampump/blocking/endpoint.hpp"

#include <cerrno>
#include <charconv>

namespace streampump::blocking {

endpoint endpoint::loopback(std::uint16_t port) {
    return endpoint{.host = "127.0.0.1", .port = port};
}

result<endpoint> endpoint::parse(std::string_view text) {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return err<endpoint>(make_error_from_errno(EINVAL));
    }

    const auto digits = text.substr(colon + 1);
    std::uint16_t port = 0;
    const auto [end, code] =
        std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (code != std::errc{} || end != digits.data() + digits.size()) {
        return err<endpoint>(make_error_from_errno(EINVAL));
    }
    return endpoint{.host = std::string{text.substr(0, colon)}, .port = port};
}

std::string endpoint::to_string() const {
    return host + ":" + std::to_string(port);
}

} // namespace streampump::blocking

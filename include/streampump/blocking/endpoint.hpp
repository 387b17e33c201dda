#pragma once

/**
 * @file
 * @brief IPv4 host and port shared by client and server sockets.
 */

#include "streampump/core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace streampump::blocking {

struct endpoint {
    /// Dotted IPv4 literal.
    std::string host;
    /// Host byte order.
    std::uint16_t port{};

    /// @return `127.0.0.1:port`.
    [[nodiscard]] static endpoint loopback(std::uint16_t port);

    /**
     * @brief Parse `host:port`.
     * @return `EINVAL` when the port is missing, not a number or out of range.
     */
    [[nodiscard]] static result<endpoint> parse(std::string_view text);

    /// @return `host:port`.
    [[nodiscard]] std::string to_string() const;
};

} // namespace streampump::blocking

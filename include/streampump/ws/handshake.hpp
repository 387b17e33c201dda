#pragma once

/**
 * @file
 * @brief RFC 6455 opening handshake: request parsing and response building.
 */

#include "streampump/core/result.hpp"
#include "streampump/pipeline/connection.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace streampump::ws {

/// Upper bound on the size of an opening handshake request or response.
inline constexpr std::size_t kMaxHandshakeBytes = 8U * 1024U;

/// @brief Parsed client upgrade request.
struct handshake_request {
    std::string method{};
    /// Path without the query string, e.g. `/echo`.
    std::string path{};
    /// Raw query string without `?`.
    std::string query{};
    /// Header fields keyed by lower-cased name.
    std::map<std::string, std::string> headers{};
    /// Value of `Sec-WebSocket-Key`.
    std::string key{};
};

/**
 * @return Offset one past the `\r\n\r\n` that ends the header block, or
 *         zero when the block is not complete yet.
 */
[[nodiscard]] std::size_t find_header_end(std::string_view raw) noexcept;

/**
 * @brief Parse and validate a client upgrade request.
 * @param raw Bytes up to and including the blank line.
 * @return The request, or `errc::handshake_failed` when it is not a valid
 *         version-13 WebSocket upgrade.
 */
[[nodiscard]] result<handshake_request>
parse_handshake_request(std::string_view raw);

/**
 * @brief Compute `Sec-WebSocket-Accept` for a client key.
 *
 * base64(SHA-1(key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11")).
 */
[[nodiscard]] std::string compute_accept_key(std::string_view client_key);

/// @brief `101 Switching Protocols` response for a validated request.
[[nodiscard]] std::string build_accept_response(const handshake_request& request);

/// @brief Plain HTTP error response used to refuse an upgrade.
[[nodiscard]] std::string build_reject_response(int status,
                                                std::string_view reason);

/**
 * @brief Look up one query parameter, percent-decoded.
 * @return Empty string when absent.
 */
[[nodiscard]] std::string query_parameter(std::string_view query,
                                          std::string_view name);

/// @brief Connection context (path, username) derived from the request.
[[nodiscard]] pipeline::connection_context
make_context(const handshake_request& request);

/// @brief Fresh random base64 `Sec-WebSocket-Key` for a client.
[[nodiscard]] result<std::string> generate_client_key();

/// @brief Client upgrade request for `target` (path plus optional query).
[[nodiscard]] std::string build_client_request(std::string_view host,
                                               std::string_view target,
                                               std::string_view key);

/**
 * @brief Validate a server's upgrade response.
 * @return `errc::handshake_failed` unless the status is 101 and the accept
 *         key matches `key`.
 */
[[nodiscard]] result<void> validate_accept_response(std::string_view raw,
                                                    std::string_view key);

} // namespace streampump::ws

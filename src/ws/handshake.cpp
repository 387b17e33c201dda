#include "streampump/ws/handshake.hpp"

#include "streampump/core/errc.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace {

constexpr std::string_view kAcceptGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr std::size_t kClientKeyBytes = 16;

[[nodiscard]] std::string to_lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

/// Case-insensitive search for `token` in a comma-separated header value.
[[nodiscard]] bool header_has_token(std::string_view value,
                                    std::string_view token) {
    const auto wanted = to_lower(token);
    while (!value.empty()) {
        const auto comma = value.find(',');
        const auto item = trim(value.substr(0, comma));
        if (to_lower(item) == wanted) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        value.remove_prefix(comma + 1);
    }
    return false;
}

[[nodiscard]] std::string base64_encode(const unsigned char *data,
                                        std::size_t size) {
    std::string out(4 * ((size + 2) / 3), '\0');
    const int written = ::EVP_EncodeBlock(
        reinterpret_cast<unsigned char *>(out.data()), data,
        static_cast<int>(size));
    out.resize(static_cast<std::size_t>(std::max(written, 0)));
    return out;
}

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < text.size()) {
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

struct parsed_head {
    std::string start_line{};
    std::map<std::string, std::string> headers{};
};

[[nodiscard]] streampump::result<parsed_head> parse_head(std::string_view raw) {
    const auto end = streampump::ws::find_header_end(raw);
    if (end == 0) {
        return streampump::err<parsed_head>(streampump::errc::handshake_failed);
    }
    raw = raw.substr(0, end - 4);

    parsed_head head{};
    auto line_end = raw.find("\r\n");
    head.start_line = std::string{raw.substr(0, line_end)};
    if (line_end == std::string_view::npos) {
        return head;
    }
    raw.remove_prefix(line_end + 2);

    while (!raw.empty()) {
        line_end = raw.find("\r\n");
        const auto line = raw.substr(0, line_end);
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return streampump::err<parsed_head>(streampump::errc::handshake_failed);
        }
        head.headers[to_lower(trim(line.substr(0, colon)))] =
            std::string{trim(line.substr(colon + 1))};
        if (line_end == std::string_view::npos) {
            break;
        }
        raw.remove_prefix(line_end + 2);
    }
    return head;
}

[[nodiscard]] std::string_view header_or_empty(
    const std::map<std::string, std::string>& headers, const std::string& name) {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string_view{} : std::string_view{it->second};
}

} // namespace

namespace streampump::ws {

std::size_t find_header_end(std::string_view raw) noexcept {
    const auto pos = raw.find("\r\n\r\n");
    return pos == std::string_view::npos ? 0 : pos + 4;
}

result<handshake_request> parse_handshake_request(std::string_view raw) {
    auto head = parse_head(raw);
    if (!head.has_value()) {
        return err<handshake_request>(head.error());
    }

    // Request line: METHOD SP target SP HTTP/1.1
    const std::string_view line = head->start_line;
    const auto first_space = line.find(' ');
    const auto last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || last_space == first_space) {
        return err<handshake_request>(errc::handshake_failed);
    }

    handshake_request request{};
    request.method = std::string{line.substr(0, first_space)};
    const auto target =
        line.substr(first_space + 1, last_space - first_space - 1);
    const auto version = line.substr(last_space + 1);
    if (request.method != "GET" || version != "HTTP/1.1" || target.empty() ||
        target.front() != '/') {
        return err<handshake_request>(errc::handshake_failed);
    }

    const auto question = target.find('?');
    request.path = std::string{target.substr(0, question)};
    if (question != std::string_view::npos) {
        request.query = std::string{target.substr(question + 1)};
    }
    request.headers = std::move(head->headers);

    const auto& headers = request.headers;
    if (!header_has_token(header_or_empty(headers, "upgrade"), "websocket") ||
        !header_has_token(header_or_empty(headers, "connection"), "upgrade") ||
        header_or_empty(headers, "sec-websocket-version") != "13") {
        return err<handshake_request>(errc::handshake_failed);
    }

    request.key = std::string{header_or_empty(headers, "sec-websocket-key")};
    if (request.key.empty()) {
        return err<handshake_request>(errc::handshake_failed);
    }
    return request;
}

std::string compute_accept_key(std::string_view client_key) {
    std::string input;
    input.reserve(client_key.size() + kAcceptGuid.size());
    input.append(client_key);
    input.append(kAcceptGuid);

    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    ::SHA1(reinterpret_cast<const unsigned char *>(input.data()), input.size(),
           digest.data());
    return base64_encode(digest.data(), digest.size());
}

std::string build_accept_response(const handshake_request& request) {
    std::string response;
    response.reserve(160);
    response.append("HTTP/1.1 101 Switching Protocols\r\n");
    response.append("Upgrade: websocket\r\n");
    response.append("Connection: Upgrade\r\n");
    response.append("Sec-WebSocket-Accept: ");
    response.append(compute_accept_key(request.key));
    response.append("\r\n\r\n");
    return response;
}

std::string build_reject_response(int status, std::string_view reason) {
    std::string response = "HTTP/1.1 " + std::to_string(status) + " ";
    response.append(reason);
    response.append("\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    return response;
}

std::string query_parameter(std::string_view query, std::string_view name) {
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        const auto equals = pair.find('=');
        const auto key = pair.substr(0, equals);
        if (percent_decode(key) == name) {
            return equals == std::string_view::npos
                       ? std::string{}
                       : percent_decode(pair.substr(equals + 1));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return {};
}

pipeline::connection_context make_context(const handshake_request& request) {
    pipeline::connection_context context{};
    context.path = request.path;
    auto username = query_parameter(request.query, "username");
    if (!username.empty()) {
        context.username = std::move(username);
    }
    return context;
}

result<std::string> generate_client_key() {
    std::array<unsigned char, kClientKeyBytes> nonce{};
    if (::RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        return err<std::string>(errc::handshake_failed);
    }
    return base64_encode(nonce.data(), nonce.size());
}

std::string build_client_request(std::string_view host, std::string_view target,
                                 std::string_view key) {
    std::string request = "GET ";
    request.append(target);
    request.append(" HTTP/1.1\r\nHost: ");
    request.append(host);
    request.append("\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n");
    request.append("Sec-WebSocket-Key: ");
    request.append(key);
    request.append("\r\nSec-WebSocket-Version: 13\r\n\r\n");
    return request;
}

result<void> validate_accept_response(std::string_view raw,
                                      std::string_view key) {
    auto head = parse_head(raw);
    if (!head.has_value()) {
        return err<void>(head.error());
    }

    const std::string_view line = head->start_line;
    const auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) {
        return err<void>(errc::handshake_failed);
    }
    int status = 0;
    const auto code = line.substr(first_space + 1, 3);
    const auto parsed =
        std::from_chars(code.data(), code.data() + code.size(), status);
    if (parsed.ec != std::errc{} || status != 101) {
        return err<void>(errc::handshake_failed);
    }

    if (header_or_empty(head->headers, "sec-websocket-accept") !=
        compute_accept_key(key)) {
        return err<void>(errc::handshake_failed);
    }
    return ok();
}

} // namespace streampump::ws

#include "streampump/services/server_options.hpp"

#include <charconv>
#include <string_view>
#include <system_error>

namespace {

using streampump::services::server_options;

template <class T>
[[nodiscard]] bool parse_number(std::string_view text, T& out) noexcept {
    if (text.empty()) {
        return false;
    }
    const auto parsed = std::from_chars(text.data(), text.data() + text.size(), out);
    return parsed.ec == std::errc{} && parsed.ptr == text.data() + text.size();
}

[[nodiscard]] bool parse_positive_ms(std::string_view text,
                                     std::chrono::milliseconds& out) noexcept {
    long long value = 0;
    if (!parse_number(text, value) || value <= 0) {
        return false;
    }
    out = std::chrono::milliseconds{value};
    return true;
}

[[nodiscard]] bool parse_count(std::string_view text, std::size_t& out) noexcept {
    std::size_t value = 0;
    if (!parse_number(text, value) || value == 0) {
        return false;
    }
    out = value;
    return true;
}

[[nodiscard]] bool apply(server_options& options, std::string_view flag,
                         std::string_view value) {
    if (flag == "--host") {
        options.host = std::string{value};
        return !options.host.empty();
    }
    if (flag == "--port") {
        unsigned int port = 0;
        if (!parse_number(value, port) || port == 0U || port > 65535U) {
            return false;
        }
        options.port = static_cast<std::uint16_t>(port);
        return true;
    }
    if (flag == "--backlog") {
        return parse_number(value, options.backlog) && options.backlog > 0;
    }
    if (flag == "--capacity") {
        return parse_count(value, options.channel_capacity);
    }
    if (flag == "--overflow") {
        if (value == "drop-newest") {
            options.overflow = streampump::pipeline::overflow_policy::drop_newest;
            return true;
        }
        if (value == "drop-oldest") {
            options.overflow = streampump::pipeline::overflow_policy::drop_oldest;
            return true;
        }
        return false;
    }
    if (flag == "--on-model-failure") {
        if (value == "terminate") {
            options.on_predictor_failure =
                streampump::pipeline::predictor_failure_policy::terminate;
            return true;
        }
        if (value == "skip") {
            options.on_predictor_failure =
                streampump::pipeline::predictor_failure_policy::skip;
            return true;
        }
        return false;
    }
    if (flag == "--workers") {
        return parse_count(value, options.worker_threads);
    }
    if (flag == "--clock-interval-ms") {
        return parse_positive_ms(value, options.clock_interval);
    }
    if (flag == "--chat-inbox") {
        return parse_count(value, options.chat_inbox_capacity);
    }
    if (flag == "--latency-ms") {
        long long latency = 0;
        if (!parse_number(value, latency) || latency < 0) {
            return false;
        }
        options.inference_latency = std::chrono::milliseconds{latency};
        return true;
    }
    if (flag == "--threshold") {
        double threshold = 0.0;
        if (!parse_number(value, threshold) || threshold < 0.0 || threshold > 1.0) {
            return false;
        }
        options.score_threshold = threshold;
        return true;
    }
    if (flag == "--send-timeout-ms") {
        return parse_positive_ms(value, options.send_timeout);
    }
    if (flag == "--handshake-timeout-ms") {
        return parse_positive_ms(value, options.handshake_timeout);
    }
    if (flag == "--max-message-bytes") {
        return parse_count(value, options.max_message_bytes);
    }
    return false;
}

} // namespace

namespace streampump::services {

std::string usage(std::string_view program) {
    std::string text = "usage: ";
    text.append(program);
    text.append(
        " [options]\n"
        "  --host ADDR                 IPv4 address to bind (127.0.0.1)\n"
        "  --port N                    TCP port (8000)\n"
        "  --backlog N                 listen backlog (128)\n"
        "  --capacity N                frames buffered per connection (1)\n"
        "  --overflow drop-newest|drop-oldest\n"
        "  --on-model-failure terminate|skip\n"
        "  --workers N                 inference threads (2)\n"
        "  --clock-interval-ms N       /clock event interval (10000)\n"
        "  --chat-inbox N              /chat events buffered per user (16)\n"
        "  --latency-ms N              simulated inference time (50)\n"
        "  --threshold X               detection score threshold (0.7)\n"
        "  --send-timeout-ms N         per-send bound (10000)\n"
        "  --handshake-timeout-ms N    upgrade request bound (5000)\n"
        "  --max-message-bytes N       inbound message limit (16777216)\n"
        "  --help\n");
    return text;
}

std::expected<server_options, std::string>
parse_server_options(int argc, const char *const *argv) {
    server_options options{};
    for (int i = 1; i < argc; ++i) {
        const std::string_view flag{argv[i]};
        if (flag == "--help" || flag == "-h") {
            options.show_help = true;
            continue;
        }
        if (i + 1 >= argc) {
            return std::unexpected{"missing value for " + std::string{flag}};
        }
        const std::string_view value{argv[++i]};
        if (!apply(options, flag, value)) {
            return std::unexpected{"invalid argument: " + std::string{flag} + " " +
                                   std::string{value}};
        }
    }
    return options;
}

} // namespace streampump::services

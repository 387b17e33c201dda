#pragma once

/**
 * @file
 * @brief Server configuration and its command line parser.
 */

#include "streampump/pipeline/duplex_pump.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace streampump::services {

/// @brief Everything the server executable can be told from the command line.
struct server_options {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8000};
    int backlog{128};

    std::size_t channel_capacity{1};
    pipeline::overflow_policy overflow{pipeline::overflow_policy::drop_newest};
    pipeline::predictor_failure_policy on_predictor_failure{
        pipeline::predictor_failure_policy::terminate};
    std::size_t worker_threads{2};

    std::chrono::milliseconds clock_interval{std::chrono::seconds{10}};
    std::size_t chat_inbox_capacity{16};
    std::chrono::milliseconds inference_latency{std::chrono::milliseconds{50}};
    double score_threshold{0.7};

    std::chrono::milliseconds send_timeout{std::chrono::seconds{10}};
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds{5}};
    std::size_t max_message_bytes{16U * 1024U * 1024U};

    bool show_help{false};
};

/// @return Multi-line usage text for `program`.
[[nodiscard]] std::string usage(std::string_view program);

/**
 * @brief Parse `--flag value` pairs.
 * @return Options, or a one-line description of the first bad argument.
 */
[[nodiscard]] std::expected<server_options, std::string>
parse_server_options(int argc, const char *const *argv);

} // namespace streampump::services

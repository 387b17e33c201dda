#pragma once

/**
 * @file
 * @brief Direct-race handlers for the echo, clock and chat endpoints.
 */

#include "streampump/pipeline/duplex_pump.hpp"
#include "streampump/services/chat.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace streampump::services {

/// @return `Message text was: {text}`.
[[nodiscard]] std::string echo_reply(std::string_view text);

/// @return ISO-8601 UTC time with microseconds and no zone suffix.
[[nodiscard]] std::string format_iso_utc(std::chrono::system_clock::time_point when);

/**
 * @brief Echoes every message; its only server event is an optional
 *        greeting sent right after the session opens.
 */
class echo_handler final : public pipeline::race_handler {
public:
    /// @param greeting Sent once before anything else, e.g. `Hello, ann!`.
    explicit echo_handler(std::optional<std::string> greeting = std::nullopt);

    [[nodiscard]] runtime::task<result<void>>
    on_message(pipeline::connection& conn, pipeline::message inbound,
               runtime::cancel_token token) override;
    [[nodiscard]] runtime::task<result<void>>
    next_event(pipeline::connection& conn, runtime::cancel_token token) override;

private:
    std::optional<std::string> greeting_{};
};

/**
 * @brief Echoes messages and, whenever the client stays quiet for one
 *        interval, sends `It is: {time}`.
 *
 * The interval restarts after every client message.
 */
class clock_handler final : public pipeline::race_handler {
public:
    explicit clock_handler(std::chrono::milliseconds interval);

    [[nodiscard]] runtime::task<result<void>>
    on_message(pipeline::connection& conn, pipeline::message inbound,
               runtime::cancel_token token) override;
    [[nodiscard]] runtime::task<result<void>>
    next_event(pipeline::connection& conn, runtime::cancel_token token) override;

private:
    std::chrono::milliseconds interval_;
};

/**
 * @brief Publishes the client's messages to the hub and forwards what other
 *        subscribers publish.
 */
class chat_handler final : public pipeline::race_handler {
public:
    chat_handler(broadcast_hub& hub, std::string username);

    [[nodiscard]] runtime::task<result<void>>
    on_message(pipeline::connection& conn, pipeline::message inbound,
               runtime::cancel_token token) override;
    [[nodiscard]] runtime::task<result<void>>
    next_event(pipeline::connection& conn, runtime::cancel_token token) override;

    [[nodiscard]] const broadcast_hub::subscription& membership() const noexcept;

private:
    broadcast_hub& hub_;
    broadcast_hub::subscription subscription_;
};

} // namespace streampump::services

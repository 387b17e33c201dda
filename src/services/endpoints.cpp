#include "streampump/services/endpoints.hpp"

#include "streampump/runtime/io_ops.hpp"

#include <ctime>
#include <cstdio>
#include <utility>

namespace streampump::services {

std::string echo_reply(std::string_view text) {
    std::string reply = "Message text was: ";
    reply.append(text);
    return reply;
}

std::string format_iso_utc(std::chrono::system_clock::time_point when) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(when);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(when - seconds);
    const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);

    std::tm utc{};
    ::gmtime_r(&raw, &utc);

    char date[32];
    const auto length = std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%06lld",
                  static_cast<long long>(micros.count()));
    return std::string{date, length} + fraction;
}

echo_handler::echo_handler(std::optional<std::string> greeting)
    : greeting_(std::move(greeting)) {}

runtime::task<result<void>>
echo_handler::on_message(pipeline::connection& conn, pipeline::message inbound,
                         runtime::cancel_token) {
    co_return co_await conn.send(
        pipeline::message::text(echo_reply(inbound.as_text())));
}

runtime::task<result<void>>
echo_handler::next_event(pipeline::connection& conn, runtime::cancel_token token) {
    if (greeting_.has_value()) {
        auto greeting = std::exchange(greeting_, std::nullopt);
        co_return co_await conn.send(pipeline::message::text(*greeting));
    }
    co_return co_await runtime::wait_for_cancel(std::move(token));
}

clock_handler::clock_handler(std::chrono::milliseconds interval)
    : interval_(interval) {}

runtime::task<result<void>>
clock_handler::on_message(pipeline::connection& conn, pipeline::message inbound,
                          runtime::cancel_token) {
    co_return co_await conn.send(
        pipeline::message::text(echo_reply(inbound.as_text())));
}

runtime::task<result<void>>
clock_handler::next_event(pipeline::connection& conn, runtime::cancel_token token) {
    const auto slept = co_await runtime::async_sleep(interval_, std::move(token));
    if (!slept.has_value()) {
        co_return slept;
    }
    co_return co_await conn.send(pipeline::message::text(
        "It is: " + format_iso_utc(std::chrono::system_clock::now())));
}

chat_handler::chat_handler(broadcast_hub& hub, std::string username)
    : hub_(hub), subscription_(hub.subscribe(std::move(username))) {}

runtime::task<result<void>>
chat_handler::on_message(pipeline::connection&, pipeline::message inbound,
                         runtime::cancel_token) {
    hub_.publish(chat_event{subscription_.username(), inbound.to_string()},
                 subscription_.id());
    co_return ok();
}

runtime::task<result<void>>
chat_handler::next_event(pipeline::connection& conn, runtime::cancel_token token) {
    auto event = co_await subscription_.events().pop(std::move(token));
    if (!event.has_value()) {
        co_return err<void>(event.error());
    }
    co_return co_await conn.send(
        pipeline::message::text(encode_chat_event(event.value())));
}

const broadcast_hub::subscription& chat_handler::membership() const noexcept {
    return subscription_;
}

} // namespace streampump::services

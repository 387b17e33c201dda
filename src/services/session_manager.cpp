#include "streampump/services/session_manager.hpp"

#include "streampump/runtime/io_ops.hpp"
#include "streampump/services/endpoints.hpp"

#include <cerrno>
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr std::chrono::milliseconds kAcceptBackoff{100};

[[nodiscard]] bool is_transient_accept_error(const streampump::error& err) noexcept {
    const int code = err.value();
    return code == ECONNABORTED || code == EINTR || code == EPROTO;
}

[[nodiscard]] bool is_descriptor_exhaustion(const streampump::error& err) noexcept {
    const int code = err.value();
    return code == EMFILE || code == ENFILE || code == ENOBUFS || code == ENOMEM;
}

} // namespace

namespace streampump::services {

std::optional<route> find_route(std::string_view path) noexcept {
    if (path == "/object-detection") {
        return route::object_detection;
    }
    if (path == "/echo") {
        return route::echo;
    }
    if (path == "/clock") {
        return route::clock;
    }
    if (path == "/chat") {
        return route::chat;
    }
    return std::nullopt;
}

session_manager::session_manager(runtime::event_loop& loop,
                                 server_options options, service_set services)
    : loop_(loop), options_(std::move(options)), services_(services) {}

void session_manager::on_report(report_callback callback) {
    on_report_ = std::move(callback);
}

runtime::task<result<void>>
session_manager::serve(streampump::nonblocking::tcp_listener& listener) {
    while (true) {
        auto accepted = co_await runtime::async_accept(listener, stop_.token());
        if (!accepted.has_value()) {
            const auto& failure = accepted.error();
            if (is_cancellation(failure)) {
                co_return ok();
            }
            if (is_transient_accept_error(failure)) {
                continue;
            }
            if (is_descriptor_exhaustion(failure)) {
                const auto paused =
                    co_await runtime::async_sleep(kAcceptBackoff, stop_.token());
                if (!paused.has_value()) {
                    co_return ok();
                }
                continue;
            }
            co_return err<void>(failure);
        }

        ++stats_.connections_accepted;
        loop_.spawn(run_session(std::move(accepted.value()), next_id_++));
    }
}

void session_manager::shutdown() {
    stop_.request_stop();
}

bool session_manager::stopping() const noexcept {
    return stop_.stop_requested();
}

const server_stats& session_manager::stats() const noexcept {
    return stats_;
}

bool session_manager::serves(std::string_view path) const noexcept {
    const auto target = find_route(path);
    if (!target.has_value()) {
        return false;
    }
    switch (*target) {
    case route::object_detection:
        return services_.detection != nullptr;
    case route::chat:
        return services_.hub != nullptr;
    case route::echo:
    case route::clock:
        return true;
    }
    return false;
}

runtime::task<void>
session_manager::run_session(streampump::nonblocking::tcp_stream stream,
                             std::uint64_t id) {
    ++stats_.live_connections;
    try {
        auto conn = std::make_unique<ws::ws_connection>(
            std::move(stream), id, limits(),
            [this](std::string_view path) { return serves(path); });

        const auto accepted = co_await conn->accept(stop_.token());
        if (!accepted.has_value()) {
            ++stats_.handshakes_rejected;
        } else {
            const auto target = find_route(conn->context().path);
            ++stats_.sessions_opened;

            pipeline::duplex_pump pump{std::move(conn), pump_settings()};
            const auto report = co_await run_route(*target, pump);
            record(report);
        }
    } catch (const std::exception&) {
        ++stats_.sessions_failed;
    } catch (...) {
        ++stats_.sessions_failed;
    }
    --stats_.live_connections;
}

runtime::task<pipeline::pump_report>
session_manager::run_route(route target, pipeline::duplex_pump& pump) {
    const auto& username = pump.conn().context().username;
    switch (target) {
    case route::object_detection:
        co_return co_await pump.run_queued(*services_.detection, services_.pool,
                                           stop_.token());
    case route::echo: {
        echo_handler handler{"Hello, " + username + "!"};
        co_return co_await pump.run_racing(handler, stop_.token());
    }
    case route::clock: {
        clock_handler handler{options_.clock_interval};
        co_return co_await pump.run_racing(handler, stop_.token());
    }
    case route::chat: {
        chat_handler handler{*services_.hub, username};
        co_return co_await pump.run_racing(handler, stop_.token());
    }
    }
    throw std::logic_error("unhandled route");
}

ws::connection_limits session_manager::limits() const noexcept {
    ws::connection_limits limits{};
    limits.decode.max_message_bytes = options_.max_message_bytes;
    limits.writer.send_timeout = options_.send_timeout;
    limits.handshake_timeout = options_.handshake_timeout;
    return limits;
}

pipeline::pump_options session_manager::pump_settings() const noexcept {
    pipeline::pump_options settings{};
    settings.channel_capacity = options_.channel_capacity;
    settings.overflow = options_.overflow;
    settings.on_predictor_failure = options_.on_predictor_failure;
    return settings;
}

void session_manager::record(const pipeline::pump_report& report) {
    ++stats_.sessions_closed;
    if (report.failed()) {
        ++stats_.sessions_failed;
    }
    stats_.frames_received += report.stats.frames_received;
    stats_.frames_dropped += report.stats.frames_dropped;
    stats_.results_sent += report.stats.results_sent;
    if (on_report_) {
        on_report_(report);
    }
}

} // namespace streampump::services

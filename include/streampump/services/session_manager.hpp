#pragma once

/**
 * @file
 * @brief Accept loop and per-connection session lifecycle.
 */

#include "streampump/nonblocking/tcp.hpp"
#include "streampump/pipeline/duplex_pump.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/event_loop.hpp"
#include "streampump/runtime/worker_pool.hpp"
#include "streampump/services/chat.hpp"
#include "streampump/services/server_options.hpp"
#include "streampump/ws/ws_connection.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace streampump::services {

/// @brief WebSocket endpoints served by the session manager.
enum class route {
    /// Queue-mediated pump running the detection predictor.
    object_detection,
    /// Direct race; greets, then echoes.
    echo,
    /// Direct race between echo and a periodic time event.
    clock,
    /// Direct race between publishing and forwarding chat events.
    chat,
};

/// @return Route for a request path, e.g. `/echo`.
[[nodiscard]] std::optional<route> find_route(std::string_view path) noexcept;

/// @brief Shared services injected into every session.
struct service_set {
    /// Required by `route::object_detection`; the route is refused without it.
    pipeline::predictor *detection{nullptr};
    /// Inference threads; `nullptr` runs the predictor on the loop thread.
    runtime::worker_pool *pool{nullptr};
    /// Required by `route::chat`; the route is refused without it.
    broadcast_hub *hub{nullptr};
};

/// @brief Totals across every connection the manager handled.
struct server_stats {
    std::uint64_t connections_accepted{0};
    std::uint64_t handshakes_rejected{0};
    std::uint64_t sessions_opened{0};
    std::uint64_t sessions_closed{0};
    std::uint64_t sessions_failed{0};
    std::uint64_t frames_received{0};
    std::uint64_t frames_dropped{0};
    std::uint64_t results_sent{0};
    /// Connections accepted but not yet released.
    std::size_t live_connections{0};
};

/**
 * @brief Runs one session per accepted connection on a single loop.
 *
 * Each session is a root task of its own: handshake, route, pump, report,
 * close. A session that fails only ends itself. All members must be used
 * from the loop thread, and the manager must outlive `loop.run()`.
 */
class session_manager {
public:
    using report_callback = std::function<void(const pipeline::pump_report&)>;

    session_manager(runtime::event_loop& loop, server_options options,
                    service_set services);

    session_manager(const session_manager&) = delete;
    session_manager& operator=(const session_manager&) = delete;

    /// @brief Receive every finished session's report.
    void on_report(report_callback callback);

    /**
     * @brief Accept connections until `shutdown()`.
     * @return Success after shutdown, or the accept error that stopped it.
     */
    [[nodiscard]] runtime::task<result<void>>
    serve(streampump::nonblocking::tcp_listener& listener);

    /// @brief Stop accepting and cancel every live session (close `1001`).
    void shutdown();

    [[nodiscard]] bool stopping() const noexcept;
    [[nodiscard]] const server_stats& stats() const noexcept;
    [[nodiscard]] bool serves(std::string_view path) const noexcept;

private:
    runtime::task<void> run_session(streampump::nonblocking::tcp_stream stream,
                                    std::uint64_t id);
    runtime::task<pipeline::pump_report> run_route(route target,
                                                   pipeline::duplex_pump& pump);
    [[nodiscard]] ws::connection_limits limits() const noexcept;
    [[nodiscard]] pipeline::pump_options pump_settings() const noexcept;
    void record(const pipeline::pump_report& report);

    runtime::event_loop& loop_;
    server_options options_;
    service_set services_{};
    runtime::cancel_source stop_{};
    server_stats stats_{};
    report_callback on_report_{};
    std::uint64_t next_id_{1};
};

} // namespace streampump::services

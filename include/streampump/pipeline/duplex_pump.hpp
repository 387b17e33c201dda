#pragma once

/**
 * @file
 * @brief Per-connection duplex pump: queue-mediated and direct-race modes.
 */

#include "streampump/pipeline/bounded_channel.hpp"
#include "streampump/pipeline/connection.hpp"
#include "streampump/pipeline/message.hpp"
#include "streampump/pipeline/predictor.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/race.hpp"
#include "streampump/runtime/task.hpp"
#include "streampump/runtime/worker_pool.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace streampump::pipeline {

/// @brief Lifecycle of a pump. Transitions only move forward.
enum class pump_state {
    /// Connection accepted, channel empty, no operation started.
    idle,
    /// Both operations are active.
    running,
    /// One operation ended; the other is being cancelled.
    draining,
    /// Connection released and channel discarded.
    closed,
};

/// @brief Why a pump stopped.
enum class termination_reason {
    none,
    /// Peer closed or vanished. Expected, not a failure.
    peer_closed,
    /// The owner's stop token fired.
    cancelled,
    /// The predictor failed under `predictor_failure_policy::terminate`.
    predictor_failed,
    /// Writing to the peer failed. Treated as a disconnect.
    send_failed,
    /// Reading from the peer failed for a reason other than disconnect.
    receive_failed,
    /// A race handler failed or threw.
    handler_failed,
};

/// @brief What the outbound loop does when the predictor fails.
enum class predictor_failure_policy {
    /// End the pump and close the connection.
    terminate,
    /// Count the failure, drop the frame and keep going.
    skip,
};

[[nodiscard]] std::string_view to_string(pump_state state) noexcept;
[[nodiscard]] std::string_view to_string(termination_reason reason) noexcept;

/// @return `true` for reasons that count as a pump failure.
[[nodiscard]] bool is_failure(termination_reason reason) noexcept;

/// @brief Pump tuning knobs.
struct pump_options {
    std::size_t channel_capacity{1};
    overflow_policy overflow{overflow_policy::drop_newest};
    predictor_failure_policy on_predictor_failure{
        predictor_failure_policy::terminate};
};

/// @brief Counters maintained by a pump while it runs.
struct pump_stats {
    std::uint64_t frames_received{0};
    std::uint64_t frames_dropped{0};
    std::uint64_t frames_processed{0};
    std::uint64_t results_sent{0};
    std::uint64_t predictor_failures{0};
    std::uint64_t events_forwarded{0};
    std::uint64_t race_rounds{0};
};

/// @brief Final account of one pump run.
struct pump_report {
    std::uint64_t connection_id{0};
    std::string endpoint{};
    pump_stats stats{};
    termination_reason reason{termination_reason::none};
    /// Error that ended the pump. Empty when it was cancelled.
    std::optional<error> failure{};
    /// Set when the closing handshake itself failed.
    std::optional<error> close_error{};

    [[nodiscard]] bool failed() const noexcept {
        return is_failure(reason);
    }
};

/**
 * @brief The two operations raced on every round of direct-race mode.
 */
class race_handler {
public:
    virtual ~race_handler() = default;

    /**
     * @brief Handle one inbound message, typically by replying.
     *
     * Runs after the message was taken off the transport, so it should finish
     * its reply even when `token` is stopped.
     */
    [[nodiscard]] virtual runtime::task<result<void>>
    on_message(connection& conn, message inbound,
               runtime::cancel_token token) = 0;

    /**
     * @brief Wait for the next server-side event and forward it.
     * @return `ECANCELED` when `token` stopped before an event arrived.
     */
    [[nodiscard]] virtual runtime::task<result<void>>
    next_event(connection& conn, runtime::cancel_token token) = 0;
};

/**
 * @brief Owns one connection and moves its traffic until it ends.
 *
 * A pump runs once, in one of two modes. Either way it never throws past
 * `run_*`, closes the connection before returning and leaves no operation
 * alive.
 */
class duplex_pump {
public:
    explicit duplex_pump(std::unique_ptr<connection> conn,
                         pump_options options = {});

    duplex_pump(const duplex_pump&) = delete;
    duplex_pump& operator=(const duplex_pump&) = delete;
    duplex_pump(duplex_pump&&) = delete;
    duplex_pump& operator=(duplex_pump&&) = delete;

    /**
     * @brief Queue-mediated mode.
     *
     * Inbound: receive, push into the channel, count drops. Outbound: pop,
     * predict, send. A result computed while the pump was being cancelled is
     * discarded.
     * @param model Shared predictor.
     * @param pool Pool to run `predict` on, or `nullptr` to call it inline.
     * @param stop Owner's stop token.
     * @throws std::logic_error when the pump already ran.
     */
    [[nodiscard]] runtime::task<pump_report>
    run_queued(predictor& model, runtime::worker_pool *pool,
               runtime::cancel_token stop);

    /**
     * @brief Direct-race mode.
     *
     * Each round races "receive and handle" against "next event"; the loser
     * is cancelled and a fresh round starts unless one of them failed.
     * @throws std::logic_error when the pump already ran.
     */
    [[nodiscard]] runtime::task<pump_report>
    run_racing(race_handler& handler, runtime::cancel_token stop);

    [[nodiscard]] pump_state state() const noexcept;
    [[nodiscard]] const pump_stats& stats() const noexcept;
    [[nodiscard]] const bounded_channel<message>& channel() const noexcept;
    [[nodiscard]] connection& conn() noexcept;

private:
    struct verdict {
        termination_reason reason{termination_reason::cancelled};
        std::optional<error> failure{};
    };

    void begin();
    [[nodiscard]] result<void> fail(std::size_t arm, termination_reason reason,
                                    const error& cause) noexcept;
    [[nodiscard]] std::optional<verdict>
    pick(const runtime::race_result<void>& race) const;

    runtime::task<result<void>> inbound_loop(runtime::cancel_token token);
    runtime::task<result<void>> outbound_loop(predictor& model,
                                              runtime::worker_pool *pool,
                                              runtime::cancel_token token);
    runtime::task<result<void>> receive_and_handle(race_handler& handler,
                                                   runtime::cancel_token token);
    runtime::task<result<void>> forward_event(race_handler& handler,
                                              runtime::cancel_token token);
    runtime::task<pump_report> finish(verdict outcome);

    std::unique_ptr<connection> conn_;
    pump_options options_{};
    bounded_channel<message> channel_;
    pump_stats stats_{};
    pump_state state_{pump_state::idle};
    std::array<termination_reason, 2> arm_reasons_{};
};

} // namespace streampump::pipeline

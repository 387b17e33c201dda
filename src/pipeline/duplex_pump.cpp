#include "streampump/pipeline/duplex_pump.hpp"

#include "streampump/core/errc.hpp"

#include <cerrno>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

using streampump::error;
using streampump::pipeline::termination_reason;

constexpr std::size_t kInboundArm = 0;
constexpr std::size_t kOutboundArm = 1;

[[nodiscard]] termination_reason receive_reason(const error& cause) noexcept {
    if (streampump::is_cancellation(cause)) {
        return termination_reason::cancelled;
    }
    if (streampump::is_disconnect(cause)) {
        return termination_reason::peer_closed;
    }
    return termination_reason::receive_failed;
}

[[nodiscard]] termination_reason send_reason(const error& cause) noexcept {
    if (streampump::is_cancellation(cause)) {
        return termination_reason::cancelled;
    }
    return termination_reason::send_failed;
}

[[nodiscard]] termination_reason handler_reason(const error& cause) noexcept {
    if (streampump::is_cancellation(cause)) {
        return termination_reason::cancelled;
    }
    if (streampump::is_disconnect(cause)) {
        return termination_reason::send_failed;
    }
    return termination_reason::handler_failed;
}

[[nodiscard]] std::uint16_t close_code_for(termination_reason reason,
                                           const std::optional<error>& cause) noexcept {
    namespace close_code = streampump::pipeline::close_code;
    switch (reason) {
    case termination_reason::cancelled:
        return close_code::going_away;
    case termination_reason::receive_failed:
        if (cause.has_value() &&
            cause->is(streampump::errc::protocol_violation)) {
            return close_code::protocol_error;
        }
        if (cause.has_value() &&
            cause->is(streampump::errc::message_too_large)) {
            return close_code::message_too_big;
        }
        return close_code::internal_error;
    case termination_reason::predictor_failed:
    case termination_reason::handler_failed:
        return close_code::internal_error;
    case termination_reason::none:
    case termination_reason::peer_closed:
    case termination_reason::send_failed:
        break;
    }
    return close_code::normal;
}

} // namespace

namespace streampump::pipeline {

std::string_view to_string(pump_state state) noexcept {
    switch (state) {
    case pump_state::idle:
        return "idle";
    case pump_state::running:
        return "running";
    case pump_state::draining:
        return "draining";
    case pump_state::closed:
        return "closed";
    }
    return "unknown";
}

std::string_view to_string(termination_reason reason) noexcept {
    switch (reason) {
    case termination_reason::none:
        return "none";
    case termination_reason::peer_closed:
        return "peer_closed";
    case termination_reason::cancelled:
        return "cancelled";
    case termination_reason::predictor_failed:
        return "predictor_failed";
    case termination_reason::send_failed:
        return "send_failed";
    case termination_reason::receive_failed:
        return "receive_failed";
    case termination_reason::handler_failed:
        return "handler_failed";
    }
    return "unknown";
}

bool is_failure(termination_reason reason) noexcept {
    return reason == termination_reason::predictor_failed ||
           reason == termination_reason::receive_failed ||
           reason == termination_reason::handler_failed;
}

duplex_pump::duplex_pump(std::unique_ptr<connection> conn,
                         pump_options options)
    : conn_(std::move(conn)), options_(options),
      channel_(options.channel_capacity, options.overflow) {
    if (!conn_) {
        throw std::invalid_argument("duplex_pump requires a connection");
    }
}

pump_state duplex_pump::state() const noexcept {
    return state_;
}

const pump_stats& duplex_pump::stats() const noexcept {
    return stats_;
}

const bounded_channel<message>& duplex_pump::channel() const noexcept {
    return channel_;
}

connection& duplex_pump::conn() noexcept {
    return *conn_;
}

void duplex_pump::begin() {
    if (state_ != pump_state::idle) {
        throw std::logic_error("duplex_pump can only run once");
    }
    state_ = pump_state::running;
    arm_reasons_.fill(termination_reason::cancelled);
}

result<void> duplex_pump::fail(std::size_t arm, termination_reason reason,
                               const error& cause) noexcept {
    arm_reasons_[arm] = reason;
    if (reason != termination_reason::cancelled &&
        state_ == pump_state::running) {
        state_ = pump_state::draining;
    }
    return err<void>(cause);
}

std::optional<duplex_pump::verdict>
duplex_pump::pick(const runtime::race_result<void>& race) const {
    std::vector<std::size_t> order{race.winner};
    for (std::size_t i = 0; i < race.results.size(); ++i) {
        if (i != race.winner) {
            order.push_back(i);
        }
    }

    for (const auto index : order) {
        const auto& outcome = race.results[index];
        if (outcome.has_value() || is_cancellation(outcome.error())) {
            continue;
        }
        return verdict{arm_reasons_[index], outcome.error()};
    }
    return std::nullopt;
}

runtime::task<pump_report>
duplex_pump::run_queued(predictor& model, runtime::worker_pool *pool,
                        runtime::cancel_token stop) {
    begin();

    verdict outcome{};
    try {
        runtime::cancel_source scope{stop};
        std::vector<runtime::task<result<void>>> loops;
        loops.push_back(inbound_loop(scope.token()));
        loops.push_back(outbound_loop(model, pool, scope.token()));

        const auto race = co_await runtime::when_first(std::move(loops), scope);
        outcome = pick(race).value_or(verdict{});
    } catch (const std::exception&) {
        outcome = verdict{termination_reason::handler_failed,
                          make_error(errc::handler_failure)};
    } catch (...) {
        outcome = verdict{termination_reason::handler_failed,
                          make_error(errc::handler_failure)};
    }

    co_return co_await finish(std::move(outcome));
}

runtime::task<pump_report>
duplex_pump::run_racing(race_handler& handler, runtime::cancel_token stop) {
    begin();

    verdict outcome{};
    try {
        while (true) {
            if (stop.stop_requested()) {
                outcome = verdict{};
                break;
            }

            runtime::cancel_source round{stop};
            std::vector<runtime::task<result<void>>> operations;
            operations.push_back(receive_and_handle(handler, round.token()));
            operations.push_back(forward_event(handler, round.token()));

            const auto race =
                co_await runtime::when_first(std::move(operations), round);
            ++stats_.race_rounds;

            if (auto failed = pick(race)) {
                outcome = std::move(*failed);
                break;
            }
            if (!conn_->is_open()) {
                outcome = verdict{termination_reason::peer_closed,
                                  make_error(errc::peer_closed)};
                break;
            }
            arm_reasons_.fill(termination_reason::cancelled);
        }
    } catch (const std::exception&) {
        outcome = verdict{termination_reason::handler_failed,
                          make_error(errc::handler_failure)};
    } catch (...) {
        outcome = verdict{termination_reason::handler_failed,
                          make_error(errc::handler_failure)};
    }

    co_return co_await finish(std::move(outcome));
}

runtime::task<result<void>>
duplex_pump::inbound_loop(runtime::cancel_token token) {
    while (true) {
        auto frame = co_await conn_->receive(token);
        if (!frame.has_value()) {
            co_return fail(kInboundArm, receive_reason(frame.error()),
                           frame.error());
        }
        ++stats_.frames_received;

        const auto pushed = channel_.try_push(std::move(frame.value()));
        if (is_drop(pushed)) {
            ++stats_.frames_dropped;
        } else if (pushed == push_outcome::closed) {
            co_return fail(kInboundArm, termination_reason::cancelled,
                           make_error_from_errno(ECANCELED));
        }
    }
}

runtime::task<result<void>>
duplex_pump::outbound_loop(predictor& model, runtime::worker_pool *pool,
                           runtime::cancel_token token) {
    while (true) {
        auto frame = co_await channel_.pop(token);
        if (!frame.has_value()) {
            co_return fail(kOutboundArm, termination_reason::cancelled,
                           frame.error());
        }

        result<message> prediction = err<message>(errc::model_failure);
        if (pool != nullptr) {
            const message& input = frame.value();
            prediction = co_await runtime::run_on(
                *pool, [&model, &input]() { return guarded_predict(model, input); });
        } else {
            prediction = guarded_predict(model, frame.value());
        }

        if (token.stop_requested()) {
            // The pump is going away; this result has nowhere to go.
            co_return fail(kOutboundArm, termination_reason::cancelled,
                           make_error_from_errno(ECANCELED));
        }

        if (!prediction.has_value()) {
            ++stats_.predictor_failures;
            if (options_.on_predictor_failure == predictor_failure_policy::skip) {
                continue;
            }
            co_return fail(kOutboundArm, termination_reason::predictor_failed,
                           prediction.error());
        }
        ++stats_.frames_processed;

        prediction->sequence = frame->sequence;
        const auto sent = co_await conn_->send(std::move(prediction.value()));
        if (!sent.has_value()) {
            co_return fail(kOutboundArm, send_reason(sent.error()), sent.error());
        }
        ++stats_.results_sent;
    }
}

runtime::task<result<void>>
duplex_pump::receive_and_handle(race_handler& handler,
                                runtime::cancel_token token) {
    auto inbound = co_await conn_->receive(token);
    if (!inbound.has_value()) {
        co_return fail(kInboundArm, receive_reason(inbound.error()),
                       inbound.error());
    }
    ++stats_.frames_received;

    const auto handled =
        co_await handler.on_message(*conn_, std::move(inbound.value()), token);
    if (!handled.has_value()) {
        co_return fail(kInboundArm, handler_reason(handled.error()),
                       handled.error());
    }
    ++stats_.frames_processed;
    co_return ok();
}

runtime::task<result<void>>
duplex_pump::forward_event(race_handler& handler, runtime::cancel_token token) {
    const auto forwarded = co_await handler.next_event(*conn_, token);
    if (!forwarded.has_value()) {
        co_return fail(kOutboundArm, handler_reason(forwarded.error()),
                       forwarded.error());
    }
    ++stats_.events_forwarded;
    co_return ok();
}

runtime::task<pump_report> duplex_pump::finish(verdict outcome) {
    if (state_ == pump_state::running) {
        state_ = pump_state::draining;
    }

    channel_.close();
    while (channel_.try_pop().has_value()) {
    }

    pump_report report{};
    report.connection_id = conn_->id();
    report.endpoint = conn_->context().path;
    report.reason = outcome.reason;
    report.failure = outcome.failure;

    const auto closed = co_await conn_->close(
        close_code_for(outcome.reason, outcome.failure),
        std::string{to_string(outcome.reason)});
    if (!closed.has_value()) {
        report.close_error = closed.error();
    }

    report.stats = stats_;
    state_ = pump_state::closed;
    co_return report;
}

} // namespace streampump::pipeline

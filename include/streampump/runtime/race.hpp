#pragma once

/**
 * @file
 * @brief First-completion race over cancellable tasks.
 *
 * `when_first` starts every operation on the awaiting coroutine's scheduler,
 * suspends until one of them finishes, stops the shared `cancel_source` so
 * the others unwind at their next suspension point, and resumes only after
 * every operation has finished. Operations must observe the source's token
 * to be cancellable; an operation that ignores it delays the race until it
 * completes on its own.
 */

#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/task.hpp"

#include <coroutine>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace streampump::runtime {

/// @brief Outcome of a homogeneous race.
template <class T>
struct race_result {
    /// Index of the first operation to finish.
    std::size_t winner{0};
    /// Result of every operation, in input order.
    std::vector<result<T>> results{};
};

/// @brief Outcome of a race between two differently typed operations.
template <class A, class B>
struct race_pair_result {
    /// `0` when `first` finished first, `1` otherwise.
    std::size_t winner{0};
    result<A> first;
    result<B> second;
};

namespace detail {

struct race_state {
    cancel_source *source{nullptr};
    std::size_t pending{0};
    std::optional<std::size_t> winner{};
    std::exception_ptr exception{};
    scheduler *sched{nullptr};
    std::coroutine_handle<> parent{};

    void finish(std::size_t index) noexcept {
        if (!winner.has_value()) {
            winner = index;
            source->request_stop();
        }
        if (--pending == 0 && parent) {
            sched->schedule(parent);
        }
    }
};

/// Owns the frames of started race operations until the race returns.
class race_arms {
public:
    race_arms() = default;
    race_arms(const race_arms&) = delete;
    race_arms& operator=(const race_arms&) = delete;

    ~race_arms() {
        for (auto frame : frames_) {
            frame.destroy();
        }
    }

    void add(task<void>&& arm) {
        frames_.push_back(arm.release());
    }

    [[nodiscard]] const std::vector<task<void>::handle_type>&
    frames() const noexcept {
        return frames_;
    }

private:
    std::vector<task<void>::handle_type> frames_{};
};

template <class T>
task<void> race_arm(task<result<T>> operation, race_state& state,
                    std::size_t index, std::optional<result<T>>& slot) {
    try {
        slot.emplace(co_await std::move(operation));
    } catch (...) {
        if (state.exception == nullptr) {
            state.exception = std::current_exception();
        }
    }
    state.finish(index);
}

/// Starts every arm on the awaiting coroutine's scheduler and resumes the
/// awaiter once the last arm has finished.
class race_join {
public:
    race_join(race_state& state, const race_arms& arms) noexcept
        : state_(state), arms_(arms) {}

    [[nodiscard]] bool await_ready() const noexcept {
        return arms_.frames().empty();
    }

    template <class Promise>
    void await_suspend(std::coroutine_handle<Promise> handle) {
        scheduler *sched = nullptr;
        if constexpr (requires(Promise& p) { p.scheduler_ptr(); }) {
            sched = handle.promise().scheduler_ptr();
        }
        if (sched == nullptr) {
            throw std::logic_error("when_first requires a scheduler");
        }

        state_.sched = sched;
        state_.parent = handle;
        for (auto frame : arms_.frames()) {
            frame.promise().set_scheduler(sched, false);
            sched->schedule(frame);
        }
    }

    void await_resume() const noexcept {}

private:
    race_state& state_;
    const race_arms& arms_;
};

} // namespace detail

/**
 * @brief Race a set of same-typed operations.
 * @param operations Operations to start; each should observe `source`.
 * @param source Stopped by the first operation to finish.
 * @return Winner index and every operation's result. Losers usually report
 *         `ECANCELED`, but may have finished normally in the same tick.
 * @throws Rethrows the first exception raised by any operation, after all
 *         operations have finished.
 */
template <class T>
task<race_result<T>> when_first(std::vector<task<result<T>>> operations,
                                cancel_source& source) {
    if (operations.empty()) {
        throw std::invalid_argument("when_first needs at least one operation");
    }

    detail::race_state state{};
    state.source = &source;
    state.pending = operations.size();

    std::vector<std::optional<result<T>>> slots(operations.size());
    detail::race_arms arms;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        arms.add(detail::race_arm<T>(std::move(operations[i]), state, i,
                                     slots[i]));
    }

    co_await detail::race_join{state, arms};

    if (state.exception != nullptr) {
        std::rethrow_exception(state.exception);
    }

    race_result<T> outcome{};
    outcome.winner = state.winner.value_or(0);
    outcome.results.reserve(slots.size());
    for (auto& slot : slots) {
        outcome.results.push_back(std::move(*slot));
    }
    co_return outcome;
}

/**
 * @brief Race two operations with different result types.
 * @see when_first(std::vector<task<result<T>>>, cancel_source&)
 */
template <class A, class B>
task<race_pair_result<A, B>> when_first(task<result<A>> first,
                                        task<result<B>> second,
                                        cancel_source& source) {
    detail::race_state state{};
    state.source = &source;
    state.pending = 2;

    std::optional<result<A>> first_slot{};
    std::optional<result<B>> second_slot{};
    detail::race_arms arms;
    arms.add(detail::race_arm<A>(std::move(first), state, 0, first_slot));
    arms.add(detail::race_arm<B>(std::move(second), state, 1, second_slot));

    co_await detail::race_join{state, arms};

    if (state.exception != nullptr) {
        std::rethrow_exception(state.exception);
    }

    co_return race_pair_result<A, B>{state.winner.value_or(0),
                                     std::move(*first_slot),
                                     std::move(*second_slot)};
}

} // namespace streampump::runtime

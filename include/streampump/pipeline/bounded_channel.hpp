#pragma once

/**
 * @file
 * @brief Fixed-capacity lossy FIFO between a producer and one consumer.
 */

#include "streampump/core/errc.hpp"
#include "streampump/runtime/cancel.hpp"
#include "streampump/runtime/task.hpp"

#include <cerrno>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>

namespace streampump::pipeline {

/// @brief What a full channel does with the next push.
enum class overflow_policy {
    /// Discard the incoming item; the queue keeps its oldest entries.
    drop_newest,
    /// Evict the oldest queued item and enqueue the incoming one.
    drop_oldest,
};

/// @brief Outcome of `bounded_channel::try_push`.
enum class push_outcome {
    enqueued,
    dropped_newest,
    dropped_oldest,
    closed,
};

/// @return `true` when the push lost an item to the overflow policy.
[[nodiscard]] constexpr bool is_drop(push_outcome outcome) noexcept {
    return outcome == push_outcome::dropped_newest ||
           outcome == push_outcome::dropped_oldest;
}

/**
 * @brief Bounded, never-blocking-on-push channel with a suspending `pop`.
 *
 * Overload is not an error: a push into a full channel applies the
 * configured `overflow_policy` and reports which item was lost. At most one
 * consumer may be suspended in `pop()` at a time. The channel must be used
 * from a single event-loop thread.
 *
 * @tparam T Item type. Must be move-constructible.
 */
template <class T>
class bounded_channel {
public:
    /**
     * @param capacity Maximum number of queued items (at least 1).
     * @param policy Overflow policy.
     * @throws std::invalid_argument when `capacity` is zero.
     */
    explicit bounded_channel(std::size_t capacity = 1,
                             overflow_policy policy = overflow_policy::drop_newest)
        : capacity_(capacity), policy_(policy) {
        if (capacity_ == 0) {
            throw std::invalid_argument("bounded_channel capacity must be >= 1");
        }
    }

    bounded_channel(const bounded_channel&) = delete;
    bounded_channel& operator=(const bounded_channel&) = delete;
    bounded_channel(bounded_channel&&) = delete;
    bounded_channel& operator=(bounded_channel&&) = delete;

    /**
     * @brief Enqueue without suspending.
     * @param item Item to add.
     * @return How the item (or the evicted one) was handled.
     */
    push_outcome try_push(T item) {
        if (closed_) {
            return push_outcome::closed;
        }

        auto outcome = push_outcome::enqueued;
        if (items_.size() >= capacity_) {
            ++dropped_;
            if (policy_ == overflow_policy::drop_newest) {
                return push_outcome::dropped_newest;
            }
            items_.pop_front();
            outcome = push_outcome::dropped_oldest;
        }

        items_.push_back(std::move(item));
        ++pushed_;
        wake_waiter();
        return outcome;
    }

    /**
     * @brief Take the oldest item, suspending until one is available.
     *
     * Cancellation wins over queued items: a stopped token yields
     * `ECANCELED` and leaves the queue untouched.
     * @return The item, `ECANCELED`, or `errc::channel_closed` once closed
     *         and drained. `EBUSY` when another consumer is already waiting.
     */
    [[nodiscard]] runtime::task<result<T>> pop(runtime::cancel_token token = {}) {
        while (true) {
            if (token.stop_requested()) {
                co_return err<T>(make_error_from_errno(ECANCELED));
            }
            if (auto item = try_pop()) {
                co_return std::move(*item);
            }
            if (closed_) {
                co_return err<T>(errc::channel_closed);
            }

            const auto woke = co_await item_awaitable{*this, token};
            if (!woke.has_value()) {
                co_return err<T>(woke.error());
            }
        }
    }

    /// @brief Take the oldest item if one is queued.
    [[nodiscard]] std::optional<T> try_pop() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item{std::move(items_.front())};
        items_.pop_front();
        return item;
    }

    /// @brief Reject further pushes and wake a waiting consumer.
    void close() noexcept {
        closed_ = true;
        wake_waiter();
    }

    [[nodiscard]] bool closed() const noexcept {
        return closed_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] overflow_policy policy() const noexcept {
        return policy_;
    }

    /// @return Items lost to the overflow policy so far.
    [[nodiscard]] std::size_t dropped() const noexcept {
        return dropped_;
    }

    /// @return Items that entered the queue so far.
    [[nodiscard]] std::size_t pushed() const noexcept {
        return pushed_;
    }

private:
    class item_awaitable {
    public:
        item_awaitable(bounded_channel& channel,
                       const runtime::cancel_token& token) noexcept
            : channel_(channel), token_(token) {}

        item_awaitable(const item_awaitable&) = delete;
        item_awaitable& operator=(const item_awaitable&) = delete;

        [[nodiscard]] bool await_ready() const noexcept {
            return false;
        }

        template <class Promise>
        bool await_suspend(std::coroutine_handle<Promise> handle) {
            runtime::scheduler *sched = nullptr;
            if constexpr (requires(Promise& p) { p.scheduler_ptr(); }) {
                sched = handle.promise().scheduler_ptr();
            }
            if (sched == nullptr) {
                status_ = err<void>(make_error_from_errno(EINVAL));
                return false;
            }
            if (channel_.waiter_) {
                status_ = err<void>(make_error_from_errno(EBUSY));
                return false;
            }

            channel_.waiter_ = handle;
            channel_.waiter_scheduler_ = sched;
            if (token_.stop_possible()) {
                registration_.emplace(token_, [this, handle]() {
                    if (channel_.waiter_ != handle) {
                        return;
                    }
                    status_ = err<void>(make_error_from_errno(ECANCELED));
                    channel_.wake_waiter();
                });
            }
            return true;
        }

        [[nodiscard]] result<void> await_resume() noexcept {
            registration_.reset();
            return status_;
        }

    private:
        bounded_channel& channel_;
        const runtime::cancel_token& token_;
        std::optional<runtime::cancel_registration> registration_{};
        result<void> status_{ok()};
    };

    void wake_waiter() noexcept {
        if (!waiter_) {
            return;
        }
        const auto handle = std::exchange(waiter_, {});
        std::exchange(waiter_scheduler_, nullptr)->schedule(handle);
    }

    std::deque<T> items_{};
    std::size_t capacity_{1};
    overflow_policy policy_{overflow_policy::drop_newest};
    std::size_t dropped_{0};
    std::size_t pushed_{0};
    bool closed_{false};
    std::coroutine_handle<> waiter_{};
    runtime::scheduler *waiter_scheduler_{nullptr};
};

} // namespace streampump::pipeline

#pragma once

/**
 * @file
 * @brief Coroutine task type and scheduler interface used by the async runtime.
 */

#include "streampump/core/result.hpp"

#include <chrono>
#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace streampump::runtime {

/**
 * @brief Scheduling interface implemented by runtime event loops.
 */
class scheduler {
public:
    virtual ~scheduler() = default;

    /// @brief Queue a coroutine for execution/resume.
    virtual void schedule(std::coroutine_handle<> handle) noexcept = 0;
    /// @brief Notify scheduler when a tracked root task reaches final suspend.
    virtual void on_task_completed() noexcept = 0;
    /**
     * @brief Register wait-until-readable interest for a descriptor.
     * @param fd Descriptor to monitor.
     * @param handle Waiting coroutine.
     * @param timeout Optional timeout.
     * @param timeout_error Error returned if timeout expires.
     */
    virtual result<void>
    wait_for_readable(int fd, std::coroutine_handle<> handle,
                      std::optional<std::chrono::milliseconds> timeout,
                      error timeout_error) noexcept = 0;
    /**
     * @brief Register wait-until-writable interest for a descriptor.
     * @param fd Descriptor to monitor.
     * @param handle Waiting coroutine.
     * @param timeout Optional timeout.
     * @param timeout_error Error returned if timeout expires.
     */
    virtual result<void>
    wait_for_writable(int fd, std::coroutine_handle<> handle,
                      std::optional<std::chrono::milliseconds> timeout,
                      error timeout_error) noexcept = 0;
    /**
     * @brief Suspend a coroutine until a point in time.
     * @param deadline Wake-up time.
     * @param handle Waiting coroutine.
     */
    virtual result<void>
    wait_until(std::chrono::steady_clock::time_point deadline,
               std::coroutine_handle<> handle) noexcept = 0;
    /**
     * @brief Wake a coroutine parked in a readiness or timer wait early.
     *
     * No-op when the coroutine is not parked (it already woke up).
     * @param handle Waiting coroutine.
     * @param reason Error reported by `consume_wait_result`.
     */
    virtual void cancel_wait(std::coroutine_handle<> handle,
                             error reason) noexcept = 0;
    /**
     * @brief Retrieve wake-up outcome for a waiter coroutine.
     * @param handle Coroutine handle used as waiter key.
     */
    virtual result<void>
    consume_wait_result(std::coroutine_handle<> handle) noexcept = 0;
    /// @brief Announce that another thread will call `schedule_remote` once.
    virtual void expect_remote_wakeup() noexcept = 0;
    /**
     * @brief Queue a coroutine for resume from any thread.
     * @param handle Coroutine announced via `expect_remote_wakeup`.
     */
    virtual void schedule_remote(std::coroutine_handle<> handle) noexcept = 0;
};

namespace detail {

class task_promise_base {
public:
    task_promise_base() noexcept = default;
    ~task_promise_base() = default;
    task_promise_base(const task_promise_base&) = default;
    task_promise_base& operator=(const task_promise_base&) = default;

    [[nodiscard]] scheduler *scheduler_ptr() const noexcept {
        return scheduler_;
    }

    void set_scheduler(scheduler *value, bool tracked) noexcept {
        scheduler_ = value;
        tracked_ = tracked;
    }

    void set_continuation(std::coroutine_handle<> continuation) noexcept {
        continuation_ = continuation;
    }

    [[nodiscard]] std::coroutine_handle<> continuation() const noexcept {
        return continuation_;
    }

    [[nodiscard]] bool tracked() const noexcept {
        return tracked_;
    }

private:
    scheduler *scheduler_{nullptr};
    std::coroutine_handle<> continuation_{};
    bool tracked_{false};
};

struct task_final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept {
        return false;
    }

    template <class Promise>
    void await_suspend(std::coroutine_handle<Promise> handle) noexcept {
        auto& promise = handle.promise();
        auto *scheduler = promise.scheduler_ptr();

        if (promise.tracked() && scheduler != nullptr) {
            scheduler->on_task_completed();
        }

        const auto continuation = promise.continuation();
        if (!continuation) {
            return;
        }

        if (scheduler != nullptr) {
            scheduler->schedule(continuation);
            return;
        }

        continuation.resume();
    }

    void await_resume() const noexcept {}
};

template <class Promise>
struct task_awaiter_base {
    std::coroutine_handle<Promise> handle_{};

    [[nodiscard]] bool await_ready() const noexcept {
        return !handle_ || handle_.done();
    }

    /// @brief Wire continuation and schedule/resume child coroutine.
    template <class Awaiting>
    bool await_suspend(std::coroutine_handle<Awaiting> awaiting) noexcept {
        auto& child = handle_.promise();
        child.set_continuation(awaiting);

        if constexpr (requires(Awaiting& p) { p.scheduler_ptr(); }) {
            if (child.scheduler_ptr() == nullptr) {
                child.set_scheduler(awaiting.promise().scheduler_ptr(), false);
            }
        }

        auto *scheduler = child.scheduler_ptr();
        if (scheduler != nullptr) {
            scheduler->schedule(handle_);
            return true;
        }

        handle_.resume();
        return false;
    }

    /// @brief Take the finished child handle, failing if it was never owned.
    [[nodiscard]] std::coroutine_handle<Promise> take_finished() {
        if (!handle_) {
            throw std::logic_error("awaited task has no coroutine handle");
        }
        return std::exchange(handle_, {});
    }

    task_awaiter_base() noexcept = default;
    explicit task_awaiter_base(std::coroutine_handle<Promise> handle) noexcept
        : handle_(handle) {}
    task_awaiter_base(const task_awaiter_base&) = delete;
    task_awaiter_base& operator=(const task_awaiter_base&) = delete;

    ~task_awaiter_base() {
        if (handle_) {
            handle_.destroy();
        }
    }
};

/**
 * @brief Shared ownership logic of `task<T>` and `task<void>`.
 */
template <class Promise>
class task_handle_owner {
public:
    using handle_type = std::coroutine_handle<Promise>;

    task_handle_owner() noexcept = default;
    explicit task_handle_owner(handle_type handle) noexcept : handle_(handle) {}

    task_handle_owner(const task_handle_owner&) = delete;
    task_handle_owner& operator=(const task_handle_owner&) = delete;

    task_handle_owner(task_handle_owner&& other) noexcept
        : handle_(std::exchange(other.handle_, {})) {}

    task_handle_owner& operator=(task_handle_owner&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    ~task_handle_owner() {
        if (handle_) {
            handle_.destroy();
        }
    }

    /// @return `true` when a coroutine handle is owned.
    [[nodiscard]] bool valid() const noexcept {
        return static_cast<bool>(handle_);
    }

    /// @return `true` when task has completed or is empty.
    [[nodiscard]] bool done() const noexcept {
        return !handle_ || handle_.done();
    }

    /**
     * @brief Release the coroutine handle to caller ownership.
     * @return Owned handle, leaving this task empty.
     */
    [[nodiscard]] handle_type release() noexcept {
        return std::exchange(handle_, {});
    }

protected:
    handle_type handle_{};
};

} // namespace detail

template <class T>
class task;

namespace detail {

template <class T>
struct value_promise : task_promise_base {
    [[nodiscard]] task<T> get_return_object() noexcept {
        return task<T>{std::coroutine_handle<value_promise>::from_promise(*this)};
    }

    [[nodiscard]] std::suspend_always initial_suspend() const noexcept {
        return {};
    }

    [[nodiscard]] task_final_awaiter final_suspend() const noexcept {
        return {};
    }

    /// @brief Return value from coroutine body.
    template <class U>
        requires std::convertible_to<U, T>
    void return_value(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U&&>) {
        value_.emplace(std::forward<U>(value));
    }

    /// @brief Store the active exception for later rethrow.
    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    /// @brief Consume and move the coroutine result.
    [[nodiscard]] T consume_result() {
        if (exception_ != nullptr) {
            std::rethrow_exception(exception_);
        }
        if (!value_.has_value()) {
            throw std::logic_error("task result is not available");
        }
        return std::move(*value_);
    }

private:
    std::optional<T> value_{};
    std::exception_ptr exception_{};
};

struct void_promise : task_promise_base {
    [[nodiscard]] task<void> get_return_object() noexcept;

    [[nodiscard]] std::suspend_always initial_suspend() const noexcept {
        return {};
    }

    [[nodiscard]] task_final_awaiter final_suspend() const noexcept {
        return {};
    }

    /// @brief Complete coroutine with no value.
    void return_void() const noexcept {}

    /// @brief Store the active exception for later rethrow.
    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    /// @brief Rethrow exception, if any.
    void consume_result() {
        if (exception_ != nullptr) {
            std::rethrow_exception(exception_);
        }
    }

private:
    std::exception_ptr exception_{};
};

} // namespace detail

template <class T>
struct task_promise_selector {
    using type = detail::value_promise<T>;
};

template <>
struct task_promise_selector<void> {
    using type = detail::void_promise;
};

/**
 * @brief Lazily started coroutine producing a `T`.
 *
 * The body does not run until the task is awaited or spawned on a loop.
 * Exceptions escaping the body are captured and rethrown to the awaiter.
 */
template <class T>
class task : public detail::task_handle_owner<
                 typename task_promise_selector<T>::type> {
public:
    /// Promise type backing `task<T>`.
    using promise_type = typename task_promise_selector<T>::type;
    /// Coroutine handle type for this task.
    using handle_type = std::coroutine_handle<promise_type>;
    /// Value produced by `co_await`.
    using value_type = T;

    /// Construct an empty task.
    task() noexcept = default;
    /// Construct from a coroutine handle.
    explicit task(handle_type handle) noexcept
        : detail::task_handle_owner<promise_type>(handle) {}

    /**
     * @brief Awaiter that transfers/resumes child task execution.
     */
    struct awaiter : detail::task_awaiter_base<promise_type> {
        using detail::task_awaiter_base<promise_type>::task_awaiter_base;

        /// @brief Return child result or rethrow child exception.
        T await_resume() {
            auto handle = this->take_finished();
            struct destroy_on_exit {
                handle_type handle;
                ~destroy_on_exit() { handle.destroy(); }
            } guard{handle};
            if constexpr (std::is_void_v<T>) {
                handle.promise().consume_result();
            } else {
                return handle.promise().consume_result();
            }
        }
    };

    /// @brief Await this task, transferring ownership to awaiter.
    [[nodiscard]] awaiter operator co_await() && noexcept {
        return awaiter{this->release()};
    }
};

} // namespace streampump::runtime

namespace streampump::runtime::detail {

inline task<void> void_promise::get_return_object() noexcept {
    return task<void>{std::coroutine_handle<void_promise>::from_promise(*this)};
}

} // namespace streampump::runtime::detail

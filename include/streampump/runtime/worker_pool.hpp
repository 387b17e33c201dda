#pragma once

/**
 * @file
 * @brief Fixed-size thread pool and the awaitable that offloads work to it.
 */

#include "streampump/runtime/task.hpp"

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace streampump::runtime {

/**
 * @brief Fixed set of threads draining a FIFO job queue.
 *
 * Destruction finishes every queued job before joining.
 */
class worker_pool {
public:
    /// @param threads Number of worker threads (at least one is started).
    explicit worker_pool(std::size_t threads);
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;
    worker_pool(worker_pool&&) = delete;
    worker_pool& operator=(worker_pool&&) = delete;

    /// @brief Queue a job; it runs on one of the pool threads.
    void submit(std::function<void()> job);

    /// @return Number of worker threads.
    [[nodiscard]] std::size_t size() const noexcept;

private:
    void run();

    std::mutex mutex_{};
    std::condition_variable cv_{};
    std::deque<std::function<void()>> jobs_{};
    bool stop_{false};
    std::vector<std::thread> threads_{};
};

namespace detail {

template <class T>
class offload_awaitable {
public:
    offload_awaitable(worker_pool& pool, std::function<T()> fn)
        : pool_(pool), fn_(std::move(fn)) {}

    offload_awaitable(const offload_awaitable&) = delete;
    offload_awaitable& operator=(const offload_awaitable&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return false;
    }

    template <class Promise>
    bool await_suspend(std::coroutine_handle<Promise> handle) {
        scheduler *sched = nullptr;
        if constexpr (requires(Promise& p) { p.scheduler_ptr(); }) {
            sched = handle.promise().scheduler_ptr();
        }

        if (sched == nullptr) {
            // No loop to hop back to: run inline on the caller.
            invoke();
            return false;
        }

        sched->expect_remote_wakeup();
        pool_.submit([this, sched, handle]() {
            invoke();
            sched->schedule_remote(handle);
        });
        return true;
    }

    T await_resume() {
        if (exception_ != nullptr) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*value_);
        }
    }

private:
    void invoke() noexcept {
        try {
            if constexpr (std::is_void_v<T>) {
                fn_();
            } else {
                value_.emplace(fn_());
            }
        } catch (...) {
            exception_ = std::current_exception();
        }
    }

    struct empty {};

    worker_pool& pool_;
    std::function<T()> fn_;
    std::conditional_t<std::is_void_v<T>, empty, std::optional<T>> value_{};
    std::exception_ptr exception_{};
};

} // namespace detail

/**
 * @brief Run `fn` on a pool thread and resume the caller on its loop thread.
 *
 * The call is not interruptible: the awaiting coroutine stays suspended
 * until `fn` returns. Exceptions thrown by `fn` are rethrown to the awaiter.
 * @param pool Pool that executes the callable.
 * @param fn Callable; it and everything it references must stay valid
 *           until the await completes.
 */
template <class Fn>
[[nodiscard]] task<std::invoke_result_t<Fn&>> run_on(worker_pool& pool, Fn fn) {
    using value_type = std::invoke_result_t<Fn&>;
    if constexpr (std::is_void_v<value_type>) {
        co_await detail::offload_awaitable<void>{pool, std::move(fn)};
    } else {
        co_return co_await detail::offload_awaitable<value_type>{pool,
                                                                 std::move(fn)};
    }
}

} // namespace streampump::runtime

#pragma once

/**
 * @file
 * @brief Single-threaded epoll-backed scheduler implementation.
 */

#include "streampump/epoll/reactor.hpp"
#include "streampump/runtime/task.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace streampump::runtime {

/**
 * @brief Coroutine scheduler/event loop backed by `epoll`.
 *
 * Every coroutine spawned on the loop runs on the thread that calls
 * `run()`. Other threads interact with it only through `stop()`,
 * `schedule_remote()` and `cancel_wait()`; the latter is forwarded to the
 * loop thread.
 */
class event_loop final : public scheduler {
public:
    /// Construct and initialize loop resources.
    event_loop() noexcept;
    /// Destroy loop and outstanding root tasks.
    ~event_loop() override;

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;
    event_loop(event_loop&&) = delete;
    event_loop& operator=(event_loop&&) = delete;

    /// @return `true` when initialization succeeded.
    [[nodiscard]] bool valid() const noexcept;
    /**
     * @brief Run loop until all root tasks complete or `stop()` is requested.
     * @return `EDEADLK` when tasks remain that nothing can ever wake.
     */
    [[nodiscard]] result<void> run() noexcept;
    /// @brief Request loop shutdown. Safe to call from any thread.
    void stop() noexcept;

    /**
     * @brief Spawn a root task tracked by this loop.
     * @tparam T Task result type.
     * @param work Task object to transfer.
     */
    template <class T>
    void spawn(task<T>&& work) noexcept {
        auto handle = work.release();
        if (!handle) {
            return;
        }

        handle.promise().set_scheduler(this, true);
        ++active_task_count_;
        root_tasks_.push_back(handle);
        schedule(handle);
    }

    /// @return Number of spawned root tasks that have not finished yet.
    [[nodiscard]] std::size_t active_tasks() const noexcept;

    /// @brief Queue a coroutine for resume on the loop thread.
    void schedule(std::coroutine_handle<> handle) noexcept override;
    /// @brief Notify loop that a tracked root task has finished.
    void on_task_completed() noexcept override;
    /// @brief Suspend coroutine until descriptor is readable.
    [[nodiscard]] result<void>
    wait_for_readable(int fd, std::coroutine_handle<> handle,
                      std::optional<std::chrono::milliseconds> timeout,
                      error timeout_error) noexcept override;
    /// @brief Suspend coroutine until descriptor is writable.
    [[nodiscard]] result<void>
    wait_for_writable(int fd, std::coroutine_handle<> handle,
                      std::optional<std::chrono::milliseconds> timeout,
                      error timeout_error) noexcept override;
    /// @brief Suspend coroutine until `deadline`.
    [[nodiscard]] result<void>
    wait_until(std::chrono::steady_clock::time_point deadline,
               std::coroutine_handle<> handle) noexcept override;
    /// @brief Wake a parked coroutine early with `reason`.
    void cancel_wait(std::coroutine_handle<> handle,
                     error reason) noexcept override;
    /// @brief Consume readiness/timeout result produced for a waiting coroutine.
    [[nodiscard]] result<void>
    consume_wait_result(std::coroutine_handle<> handle) noexcept override;
    /// @brief Keep the loop alive until a matching `schedule_remote`.
    void expect_remote_wakeup() noexcept override;
    /// @brief Queue a coroutine for resume from another thread.
    void schedule_remote(std::coroutine_handle<> handle) noexcept override;

private:
    struct wait_registration {
        std::coroutine_handle<> handle{};
        std::optional<std::chrono::steady_clock::time_point> deadline{};
        error timeout_error = make_error_from_errno(ETIMEDOUT);
    };

    struct waiter_slot {
        wait_registration readable{};
        wait_registration writable{};
        std::uint32_t registered_mask{0};
    };

    struct waiter_location {
        int fd{-1};
        bool readable{true};
    };

    using timer_queue =
        std::multimap<std::chrono::steady_clock::time_point,
                      std::coroutine_handle<>>;

    [[nodiscard]] result<void>
    arm_waiter(int fd, std::coroutine_handle<> handle, bool readable,
               std::optional<std::chrono::milliseconds> timeout,
               error timeout_error) noexcept;
    [[nodiscard]] result<void> refresh_interest(int fd,
                                                waiter_slot& slot) noexcept;
    void release_registration(wait_registration& registration) noexcept;
    void process_expired_waiters() noexcept;
    void process_expired_timers() noexcept;
    void drain_remote() noexcept;
    void signal_wakeup() noexcept;
    void consume_wakeup() noexcept;
    void process_ready_event(const streampump::epoll::ready_event& event) noexcept;
    [[nodiscard]] int compute_wait_timeout_ms() const noexcept;
    [[nodiscard]] bool has_pending_wakeups() const noexcept;
    [[nodiscard]] static std::uintptr_t
    handle_key(std::coroutine_handle<> handle) noexcept;
    void cleanup_completed_roots() noexcept;
    void destroy_all_roots() noexcept;

    streampump::epoll::reactor reactor_{};
    std::optional<streampump::error> init_error_{};
    std::optional<streampump::error> loop_error_{};

    std::deque<std::coroutine_handle<>> ready_queue_{};
    std::unordered_map<int, waiter_slot> waiters_{};
    std::unordered_map<std::uintptr_t, waiter_location> waiter_index_{};
    std::unordered_map<std::uintptr_t, result<void>> wait_results_{};
    timer_queue timers_{};
    std::unordered_map<std::uintptr_t, timer_queue::iterator> timer_index_{};
    std::vector<std::coroutine_handle<>> root_tasks_{};

    mutable std::mutex remote_mutex_{};
    std::vector<std::coroutine_handle<>> remote_ready_{};
    std::size_t expected_remote_count_{0};
    std::vector<std::pair<std::coroutine_handle<>, error>> remote_cancels_{};
    std::atomic<std::thread::id> loop_thread_{};

    std::size_t pending_waiter_count_{0};
    std::size_t timed_waiter_count_{0};
    std::size_t active_task_count_{0};
    std::optional<std::chrono::steady_clock::time_point> next_deadline_{};
    bool deadline_index_dirty_{false};
    std::atomic_bool stop_requested_{false};
    streampump::unique_fd wake_fd_{};
};

} // namespace streampump::runtime

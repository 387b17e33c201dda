#include "streampump/runtime/event_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <limits>
#include <sys/eventfd.h>
#include <sys/epoll.h>
#include <unistd.h>

namespace {

constexpr std::uint32_t kReadReadyMask =
    EPOLLIN | EPOLLERR | EPOLLHUP | EPOLLRDHUP;
constexpr std::uint32_t kWriteReadyMask = EPOLLOUT | EPOLLERR | EPOLLHUP;
constexpr std::uint32_t kCommonFlags =
    EPOLLET | EPOLLERR | EPOLLHUP | EPOLLRDHUP;

} // namespace

namespace streampump::runtime {

event_loop::event_loop() noexcept {
    waiters_.reserve(256);
    waiter_index_.reserve(256);
    wait_results_.reserve(256);
    timer_index_.reserve(256);
    root_tasks_.reserve(256);

    auto reactor_result = streampump::epoll::reactor::create();
    if (!reactor_result.has_value()) {
        init_error_ = reactor_result.error();
        return;
    }
    reactor_ = std::move(reactor_result.value());

    const int wake_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd < 0) {
        init_error_ = error::from_errno();
        return;
    }
    wake_fd_ = streampump::unique_fd{wake_fd};

    const auto register_result = reactor_.add(wake_fd_.get(), EPOLLIN);
    if (!register_result.has_value()) {
        init_error_ = register_result.error();
    }
}

event_loop::~event_loop() {
    destroy_all_roots();
}

bool event_loop::valid() const noexcept {
    return !init_error_.has_value() && reactor_.valid();
}

std::size_t event_loop::active_tasks() const noexcept {
    return active_task_count_;
}

result<void> event_loop::run() noexcept {
    if (!valid()) {
        return err<void>(init_error_.value_or(make_error_from_errno(EINVAL)));
    }

    stop_requested_.store(false, std::memory_order_release);
    loop_error_.reset();

    struct owner_guard {
        std::atomic<std::thread::id>& owner;
        ~owner_guard() { owner.store(std::thread::id{}); }
    } owner{loop_thread_};
    loop_thread_.store(std::this_thread::get_id());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        drain_remote();
        process_expired_timers();
        process_expired_waiters();
        if (stop_requested_.load(std::memory_order_acquire) ||
            loop_error_.has_value()) {
            break;
        }

        while (!ready_queue_.empty()) {
            const auto handle = ready_queue_.front();
            ready_queue_.pop_front();

            if (!handle || handle.done()) {
                continue;
            }

            handle.resume();
            cleanup_completed_roots();
            process_expired_timers();
            process_expired_waiters();

            if (stop_requested_.load(std::memory_order_acquire) ||
                loop_error_.has_value()) {
                break;
            }
        }

        if (stop_requested_.load(std::memory_order_acquire) ||
            loop_error_.has_value()) {
            break;
        }

        drain_remote();
        if (ready_queue_.empty()) {
            if (active_task_count_ == 0 && !has_pending_wakeups()) {
                break;
            }

            if (!has_pending_wakeups()) {
                cleanup_completed_roots();
                return err<void>(make_error_from_errno(EDEADLK));
            }

            const auto ready = reactor_.wait(
                std::chrono::milliseconds{compute_wait_timeout_ms()});
            if (!ready.has_value()) {
                return err<void>(ready.error());
            }

            for (const auto& event : ready.value()) {
                process_ready_event(event);
                if (loop_error_.has_value()) {
                    break;
                }
            }
        }
    }

    cleanup_completed_roots();
    if (loop_error_.has_value()) {
        return err<void>(loop_error_.value());
    }

    return ok();
}

void event_loop::stop() noexcept {
    stop_requested_.store(true, std::memory_order_release);
    signal_wakeup();
}

void event_loop::schedule(std::coroutine_handle<> handle) noexcept {
    if (!handle) {
        return;
    }
    ready_queue_.push_back(handle);
}

void event_loop::on_task_completed() noexcept {
    if (active_task_count_ > 0) {
        --active_task_count_;
    }
}

result<void>
event_loop::wait_for_readable(int fd, std::coroutine_handle<> handle,
                              std::optional<std::chrono::milliseconds> timeout,
                              error timeout_error) noexcept {
    return arm_waiter(fd, handle, true, timeout, timeout_error);
}

result<void>
event_loop::wait_for_writable(int fd, std::coroutine_handle<> handle,
                              std::optional<std::chrono::milliseconds> timeout,
                              error timeout_error) noexcept {
    return arm_waiter(fd, handle, false, timeout, timeout_error);
}

result<void>
event_loop::wait_until(std::chrono::steady_clock::time_point deadline,
                       std::coroutine_handle<> handle) noexcept {
    if (!valid()) {
        return err<void>(init_error_.value_or(make_error_from_errno(EINVAL)));
    }
    if (!handle) {
        return err<void>(make_error_from_errno(EINVAL));
    }

    const auto key = handle_key(handle);
    if (timer_index_.contains(key)) {
        return err<void>(make_error_from_errno(EBUSY));
    }

    timer_index_.emplace(key, timers_.emplace(deadline, handle));
    return ok();
}

void event_loop::cancel_wait(std::coroutine_handle<> handle,
                             error reason) noexcept {
    if (!handle) {
        return;
    }

    const auto owner = loop_thread_.load();
    if (owner != std::thread::id{} && owner != std::this_thread::get_id()) {
        const std::lock_guard lock{remote_mutex_};
        remote_cancels_.emplace_back(handle, reason);
        signal_wakeup();
        return;
    }

    const auto key = handle_key(handle);

    if (auto timer = timer_index_.find(key); timer != timer_index_.end()) {
        timers_.erase(timer->second);
        timer_index_.erase(timer);
        wait_results_[key] = err<void>(reason);
        schedule(handle);
        return;
    }

    auto location = waiter_index_.find(key);
    if (location == waiter_index_.end()) {
        return;
    }

    const int fd = location->second.fd;
    const bool readable = location->second.readable;
    waiter_index_.erase(location);

    auto slot_it = waiters_.find(fd);
    if (slot_it == waiters_.end()) {
        return;
    }

    auto& slot = slot_it->second;
    auto& registration = readable ? slot.readable : slot.writable;
    if (registration.handle != handle) {
        return;
    }

    release_registration(registration);
    wait_results_[key] = err<void>(reason);
    schedule(handle);

    const auto refresh_result = refresh_interest(fd, slot);
    if (!refresh_result.has_value()) {
        loop_error_ = refresh_result.error();
        stop_requested_.store(true, std::memory_order_release);
        return;
    }

    if (!slot.readable.handle && !slot.writable.handle) {
        waiters_.erase(slot_it);
    }
}

result<void>
event_loop::consume_wait_result(std::coroutine_handle<> handle) noexcept {
    if (!handle) {
        return err<void>(make_error_from_errno(EINVAL));
    }

    const auto key = handle_key(handle);
    auto it = wait_results_.find(key);
    if (it == wait_results_.end()) {
        return ok();
    }

    auto status = std::move(it->second);
    wait_results_.erase(it);
    return status;
}

void event_loop::expect_remote_wakeup() noexcept {
    const std::lock_guard lock{remote_mutex_};
    ++expected_remote_count_;
}

void event_loop::schedule_remote(std::coroutine_handle<> handle) noexcept {
    // Signal under the lock: once the loop drains this handle it may finish
    // and be destroyed, so the caller must not touch `this` afterwards.
    const std::lock_guard lock{remote_mutex_};
    remote_ready_.push_back(handle);
    signal_wakeup();
}

result<void>
event_loop::arm_waiter(int fd, std::coroutine_handle<> handle, bool readable,
                       std::optional<std::chrono::milliseconds> timeout,
                       error timeout_error) noexcept {
    if (!valid()) {
        return err<void>(init_error_.value_or(make_error_from_errno(EINVAL)));
    }
    if (fd < 0 || !handle) {
        return err<void>(make_error_from_errno(EBADF));
    }

    if (timeout.has_value() &&
        timeout.value() <= std::chrono::milliseconds{0}) {
        wait_results_[handle_key(handle)] = err<void>(timeout_error);
        schedule(handle);
        return ok();
    }

    auto [it, inserted] = waiters_.try_emplace(fd);
    auto& slot = it->second;
    auto& target_registration = readable ? slot.readable : slot.writable;
    if (target_registration.handle) {
        return err<void>(make_error_from_errno(EBUSY));
    }

    target_registration.handle = handle;
    target_registration.timeout_error = timeout_error;
    if (timeout.has_value()) {
        target_registration.deadline =
            std::chrono::steady_clock::now() + timeout.value();
        ++timed_waiter_count_;
        if (!next_deadline_.has_value() ||
            target_registration.deadline.value() < next_deadline_.value()) {
            next_deadline_ = target_registration.deadline.value();
        }
    } else {
        target_registration.deadline.reset();
    }
    deadline_index_dirty_ = true;

    ++pending_waiter_count_;
    const auto refresh_result = refresh_interest(fd, slot);
    if (!refresh_result.has_value()) {
        release_registration(target_registration);
        if (!slot.readable.handle && !slot.writable.handle) {
            waiters_.erase(it);
        }
        return refresh_result;
    }

    waiter_index_[handle_key(handle)] = waiter_location{fd, readable};
    return ok();
}

result<void> event_loop::refresh_interest(int fd, waiter_slot& slot) noexcept {
    const bool has_read_waiter = static_cast<bool>(slot.readable.handle);
    const bool has_write_waiter = static_cast<bool>(slot.writable.handle);

    std::uint32_t desired_mask = 0;
    if (has_read_waiter || has_write_waiter) {
        desired_mask = kCommonFlags;
        if (has_read_waiter) {
            desired_mask |= EPOLLIN;
        }
        if (has_write_waiter) {
            desired_mask |= EPOLLOUT;
        }
    }

    if (slot.registered_mask == desired_mask) {
        return ok();
    }

    if (slot.registered_mask == 0 && desired_mask != 0) {
        const auto add_result = reactor_.add(fd, desired_mask);
        if (!add_result.has_value()) {
            return add_result;
        }
        slot.registered_mask = desired_mask;
        return ok();
    }

    if (slot.registered_mask != 0 && desired_mask == 0) {
        const auto remove_result = reactor_.remove(fd);
        // ENOENT: the descriptor was closed and dropped by the kernel already.
        if (!remove_result.has_value() && remove_result.error().value() != ENOENT) {
            return remove_result;
        }
        slot.registered_mask = 0;
        return ok();
    }

    const auto modify_result = reactor_.modify(fd, desired_mask);
    if (!modify_result.has_value()) {
        return modify_result;
    }
    slot.registered_mask = desired_mask;
    return ok();
}

void event_loop::release_registration(
    wait_registration& registration) noexcept {
    if (registration.deadline.has_value() && timed_waiter_count_ > 0) {
        --timed_waiter_count_;
        deadline_index_dirty_ = true;
    }
    registration = wait_registration{};
    if (pending_waiter_count_ > 0) {
        --pending_waiter_count_;
    }
}

void event_loop::process_expired_timers() noexcept {
    if (timers_.empty()) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    while (!timers_.empty() && timers_.begin()->first <= now) {
        const auto handle = timers_.begin()->second;
        const auto key = handle_key(handle);
        timers_.erase(timers_.begin());
        timer_index_.erase(key);
        wait_results_[key] = ok();
        schedule(handle);
    }
}

void event_loop::process_expired_waiters() noexcept {
    if (timed_waiter_count_ == 0) {
        next_deadline_.reset();
        deadline_index_dirty_ = false;
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (!deadline_index_dirty_ && next_deadline_.has_value() &&
        now < next_deadline_.value()) {
        return;
    }

    auto next_deadline = std::chrono::steady_clock::time_point::max();
    bool has_next_deadline = false;

    const auto expire = [&](wait_registration& registration) {
        if (!registration.handle || !registration.deadline.has_value() ||
            now < registration.deadline.value()) {
            return false;
        }
        const auto key = handle_key(registration.handle);
        wait_results_[key] = err<void>(registration.timeout_error);
        waiter_index_.erase(key);
        schedule(registration.handle);
        release_registration(registration);
        return true;
    };

    for (auto it = waiters_.begin(); it != waiters_.end();) {
        const bool read_expired = expire(it->second.readable);
        const bool write_expired = expire(it->second.writable);

        if (read_expired || write_expired) {
            const auto refresh_result = refresh_interest(it->first, it->second);
            if (!refresh_result.has_value()) {
                loop_error_ = refresh_result.error();
                stop_requested_.store(true, std::memory_order_release);
                return;
            }
        }

        if (!it->second.readable.handle && !it->second.writable.handle) {
            it = waiters_.erase(it);
            continue;
        }

        for (const auto *registration :
             {&it->second.readable, &it->second.writable}) {
            if (registration->handle && registration->deadline.has_value()) {
                next_deadline =
                    std::min(next_deadline, registration->deadline.value());
                has_next_deadline = true;
            }
        }
        ++it;
    }

    if (has_next_deadline) {
        next_deadline_ = next_deadline;
    } else {
        next_deadline_.reset();
    }
    deadline_index_dirty_ = false;
}

void event_loop::drain_remote() noexcept {
    std::vector<std::coroutine_handle<>> drained;
    std::vector<std::pair<std::coroutine_handle<>, error>> cancels;
    {
        const std::lock_guard lock{remote_mutex_};
        if (remote_ready_.empty() && remote_cancels_.empty()) {
            return;
        }
        drained.swap(remote_ready_);
        cancels.swap(remote_cancels_);
        expected_remote_count_ -=
            std::min(expected_remote_count_, drained.size());
    }

    for (const auto handle : drained) {
        schedule(handle);
    }
    for (const auto& [handle, reason] : cancels) {
        cancel_wait(handle, reason);
    }
}

void event_loop::signal_wakeup() noexcept {
    if (!wake_fd_.valid()) {
        return;
    }

    std::uint64_t signal = 1;
    while (::write(wake_fd_.get(), &signal, sizeof(signal)) < 0) {
        if (errno != EINTR) {
            // EAGAIN means the counter is already non-zero, so a wakeup is pending.
            break;
        }
    }
}

void event_loop::consume_wakeup() noexcept {
    if (!wake_fd_.valid()) {
        return;
    }

    std::uint64_t signal = 0;
    while (::read(wake_fd_.get(), &signal, sizeof(signal)) < 0 && errno == EINTR) {}
}

void event_loop::process_ready_event(
    const streampump::epoll::ready_event& event) noexcept {
    if (wake_fd_.valid() && event.fd == wake_fd_.get()) {
        consume_wakeup();
        drain_remote();
        return;
    }

    auto it = waiters_.find(event.fd);
    if (it == waiters_.end()) {
        return;
    }

    auto& slot = it->second;

    const auto complete = [&](wait_registration& registration,
                              std::uint32_t mask) {
        if (!registration.handle ||
            !event.has(mask)) {
            return;
        }
        const auto key = handle_key(registration.handle);
        wait_results_[key] = ok();
        waiter_index_.erase(key);
        schedule(registration.handle);
        release_registration(registration);
    };

    complete(slot.readable, kReadReadyMask);
    complete(slot.writable, kWriteReadyMask);

    const auto refresh_result = refresh_interest(event.fd, slot);
    if (!refresh_result.has_value()) {
        loop_error_ = refresh_result.error();
        stop_requested_.store(true, std::memory_order_release);
        return;
    }

    if (!slot.readable.handle && !slot.writable.handle) {
        waiters_.erase(it);
    }
}

int event_loop::compute_wait_timeout_ms() const noexcept {
    std::optional<std::chrono::steady_clock::time_point> deadline =
        next_deadline_;
    if (!timers_.empty() &&
        (!deadline.has_value() || timers_.begin()->first < deadline.value())) {
        deadline = timers_.begin()->first;
    }

    if (!deadline.has_value()) {
        return -1;
    }

    const auto remaining = deadline.value() - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
        return 0;
    }

    // Round up so a sub-millisecond remainder does not spin with timeout 0.
    const auto clamped = std::min<long long>(
        std::chrono::ceil<std::chrono::milliseconds>(remaining).count(),
        static_cast<long long>(std::numeric_limits<int>::max()));
    return static_cast<int>(clamped);
}

bool event_loop::has_pending_wakeups() const noexcept {
    if (pending_waiter_count_ > 0 || !timers_.empty()) {
        return true;
    }

    const std::lock_guard lock{remote_mutex_};
    return expected_remote_count_ > 0 || !remote_ready_.empty();
}

std::uintptr_t event_loop::handle_key(std::coroutine_handle<> handle) noexcept {
    return reinterpret_cast<std::uintptr_t>(handle.address());
}

void event_loop::cleanup_completed_roots() noexcept {
    for (auto it = root_tasks_.begin(); it != root_tasks_.end(); ) {
        if (it->done()) {
            it->destroy();
            it = root_tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void event_loop::destroy_all_roots() noexcept {
    for (auto handle : root_tasks_) {
        if (handle) {
            handle.destroy();
        }
    }
    root_tasks_.clear();
}

} // namespace streampump::runtime

#pragma once

/**
 * @file
 * @brief epoll instance that owns its event batch.
 */

#include "streampump/core/result.hpp"
#include "streampump/core/unique_fd.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <sys/epoll.h>
#include <vector>

namespace streampump::epoll {

/// @brief Readiness reported for one descriptor.
struct ready_event {
    int fd{-1};
    /// `EPOLLIN`, `EPOLLOUT`, `EPOLLHUP`, ... as reported by the kernel.
    std::uint32_t events{0};

    [[nodiscard]] bool has(std::uint32_t flag) const noexcept {
        return (events & flag) != 0U;
    }
};

/**
 * @brief Descriptor interest set plus the buffer `wait()` fills.
 *
 * The span returned by `wait()` points into the reactor and stays valid
 * until the next call.
 */
class reactor {
public:
    static constexpr std::size_t kDefaultBatch = 64;

    reactor() noexcept = default;

    reactor(const reactor&) = delete;
    reactor& operator=(const reactor&) = delete;
    reactor(reactor&&) noexcept = default;
    reactor& operator=(reactor&&) noexcept = default;

    /// @param batch Most events reported by one `wait()`, at least 1.
    [[nodiscard]] static result<reactor> create(std::size_t batch = kDefaultBatch);

    [[nodiscard]] result<void> add(int fd, std::uint32_t events) noexcept;
    [[nodiscard]] result<void> modify(int fd, std::uint32_t events) noexcept;
    /// @return `ENOENT` when `fd` was not registered.
    [[nodiscard]] result<void> remove(int fd) noexcept;

    /**
     * @brief Block until a registered descriptor is ready or `timeout` passes.
     *
     * A negative timeout waits forever. An interrupted wait reports no events.
     */
    [[nodiscard]] result<std::span<const ready_event>>
    wait(std::chrono::milliseconds timeout) noexcept;

    /// @return Descriptors currently registered.
    [[nodiscard]] std::size_t watched() const noexcept;
    [[nodiscard]] int native_handle() const noexcept;
    [[nodiscard]] bool valid() const noexcept;

private:
    reactor(streampump::unique_fd epoll_fd, std::size_t batch);

    [[nodiscard]] result<void> control(int operation, int fd,
                                       std::uint32_t events) noexcept;

    streampump::unique_fd epoll_fd_{};
    std::vector<::epoll_event> raw_{};
    std::vector<ready_event> ready_{};
    std::size_t watched_{0};
};

} // namespace streampump::epoll

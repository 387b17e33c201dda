#pragma once

/**
 * @file
 * @brief Move-only owner of a POSIX descriptor.
 */

#include "streampump/core/result.hpp"

#include <utility>

namespace streampump {

/// Closes the owned descriptor on destruction; `-1` means empty.
class unique_fd {
public:
    unique_fd() noexcept = default;
    explicit unique_fd(int fd) noexcept : fd_(fd) {}
    ~unique_fd() noexcept {
        reset();
    }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
    unique_fd& operator=(unique_fd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept {
        return fd_;
    }
    [[nodiscard]] bool valid() const noexcept {
        return fd_ >= 0;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
        return valid();
    }

    /// @return The descriptor, no longer owned.
    [[nodiscard]] int release() noexcept {
        return std::exchange(fd_, -1);
    }

    /// @brief Close the current descriptor (errors ignored) and adopt `fd`.
    void reset(int fd = -1) noexcept;

    /**
     * @brief Close now and report what `close(2)` said.
     * @return `EBADF` when nothing is owned.
     */
    [[nodiscard]] result<void> close() noexcept;

private:
    int fd_{-1};
};

} // namespace streampump

#pragma once

/**
 * @file
 * @brief `error`: an errno value or a pipeline `errc`, carried by `result<T>`.
 */

#include <cerrno>
#include <string>
#include <system_error>

namespace streampump {

enum class errc;

/**
 * @brief Failure value of every `result<T>`.
 *
 * Sockets, timers and cancellation report errno values in the system
 * category. Conditions with no errno counterpart use `errc` (see
 * `streampump/core/errc.hpp`).
 */
class error {
public:
    /// Empty error, `value() == 0`.
    error() noexcept = default;
    explicit error(std::error_code code) noexcept : code_(code) {}

    /// @param value errno value, the current `errno` by default.
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    [[nodiscard]] std::error_code code() const noexcept {
        return code_;
    }
    [[nodiscard]] int value() const noexcept {
        return code_.value();
    }
    [[nodiscard]] std::string message() const;

    /// @return `true` when this is the pipeline code `value`.
    [[nodiscard]] bool is(errc value) const noexcept;
    /// @return `true` when this is the errno value `value`.
    [[nodiscard]] bool is_errno(int value) const noexcept;

    friend bool operator==(const error&, const error&) noexcept = default;

private:
    std::error_code code_{};
};

[[nodiscard]] error make_error_from_errno(int value) noexcept;

} // namespace streampump

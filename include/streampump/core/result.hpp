#pragma once

/**
 * @file
 * @brief `result<T>` and the `ok` / `err` shorthands.
 */

#include "streampump/core/errc.hpp"
#include "streampump/core/error.hpp"

#include <expected>
#include <type_traits>
#include <utility>

namespace streampump {

/// Value or `error`; the return type of every fallible operation.
template <class T>
using result = std::expected<T, error>;

template <class T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value) {
    return result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr result<void> ok() {
    return result<void>{};
}

template <class T>
[[nodiscard]] constexpr result<T> err(error e) {
    return std::unexpected<error>{std::move(e)};
}

/// @brief Failed `result<T>` carrying a pipeline code.
template <class T>
[[nodiscard]] result<T> err(errc code) {
    return std::unexpected<error>{make_error(code)};
}

} // namespace streampump

#pragma once

/**
 * @file
 * @brief Cooperative cancellation primitives for async operations.
 *
 * A `cancel_source` signals every `cancel_token` derived from it. Suspended
 * operations attach a `cancel_registration` to their token so that a stop
 * request wakes them immediately instead of at their next poll.
 *
 * Callbacks run synchronously on the thread that calls `request_stop()`.
 * Runtime awaitables only reschedule coroutines from their callbacks, so
 * sources that guard loop-owned operations must be stopped on the loop
 * thread. Use `event_loop::stop()` to interrupt a loop from elsewhere.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace streampump::runtime {

namespace detail {

class cancel_state {
public:
    [[nodiscard]] bool stop_requested() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    /// @return Registration id, or 0 when already stopped (callback ran).
    std::uint64_t add_callback(std::function<void()> callback);
    void remove_callback(std::uint64_t id) noexcept;
    /// @return `true` for the call that performed the transition.
    bool request_stop();

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_{};
    std::uint64_t next_id_{1};
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks_{};
};

} // namespace detail

/**
 * @brief Read-only cancellation token shared with async operations.
 */
class cancel_token {
public:
    /// Construct a token that never cancels.
    cancel_token() = default;

    /// @return `true` when associated source has requested cancellation.
    [[nodiscard]] bool stop_requested() const noexcept {
        return state_ != nullptr && state_->stop_requested();
    }

    /// @return `true` when a source can ever cancel this token.
    [[nodiscard]] bool stop_possible() const noexcept {
        return state_ != nullptr;
    }

private:
    friend class cancel_source;
    friend class cancel_registration;
    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_{};
};

/**
 * @brief Scoped stop callback bound to a token.
 *
 * The callback runs at most once: immediately on construction when the
 * token is already stopped, otherwise on the first `request_stop()` that
 * happens while the registration is alive.
 */
class cancel_registration {
public:
    cancel_registration(const cancel_token& token,
                        std::function<void()> callback);
    ~cancel_registration();

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;
    cancel_registration(cancel_registration&&) = delete;
    cancel_registration& operator=(cancel_registration&&) = delete;

private:
    std::shared_ptr<detail::cancel_state> state_{};
    std::uint64_t id_{0};
};

/**
 * @brief Cancellation source that can signal one or more tokens.
 */
class cancel_source {
public:
    /// Construct an active source.
    cancel_source();
    /**
     * @brief Construct a source that also stops when `parent` stops.
     * @param parent Token of the enclosing scope.
     */
    explicit cancel_source(const cancel_token& parent);

    cancel_source(const cancel_source&) = delete;
    cancel_source& operator=(const cancel_source&) = delete;
    cancel_source(cancel_source&&) noexcept = default;
    cancel_source& operator=(cancel_source&&) noexcept = default;
    ~cancel_source() = default;

    /// @return Token bound to this source.
    [[nodiscard]] cancel_token token() const {
        return cancel_token{state_};
    }

    /// @brief Request cancellation for all tokens derived from this source.
    void request_stop() const;

    /// @return `true` once `request_stop()` ran here or on the parent.
    [[nodiscard]] bool stop_requested() const noexcept {
        return state_->stop_requested();
    }

private:
    std::shared_ptr<detail::cancel_state> state_{};
    std::unique_ptr<cancel_registration> parent_link_{};
};

} // namespace streampump::runtime

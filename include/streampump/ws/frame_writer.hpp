#pragma once

/**
 * @file
 * @brief Serialized, bounded frame writer shared by a connection's reader
 *        and sender.
 */

#include "streampump/nonblocking/tcp.hpp"
#include "streampump/runtime/task.hpp"

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace streampump::ws {

/// @brief Bounds applied to outbound data.
struct writer_limits {
    /// Largest amount of encoded frames waiting for the socket.
    std::size_t max_queued_bytes{4U * 1024U * 1024U};
    /// Upper bound for one `flush()` call.
    std::chrono::milliseconds send_timeout{std::chrono::seconds{10}};
};

/**
 * @brief Queue of whole encoded frames drained to a socket.
 *
 * Frames are queued whole and written in order, so frames queued by
 * different coroutines never interleave on the wire. Only one coroutine
 * writes at a time; a second `flush()` waits for the active one to finish
 * and then drains whatever is left.
 */
class frame_writer {
public:
    /**
     * @param stream Socket owned by the caller; must outlive the writer.
     * @param limits Queue and timeout bounds.
     */
    explicit frame_writer(streampump::nonblocking::tcp_stream& stream,
                          writer_limits limits = {}) noexcept;

    frame_writer(const frame_writer&) = delete;
    frame_writer& operator=(const frame_writer&) = delete;

    /**
     * @brief Queue one encoded frame.
     * @return `EWOULDBLOCK` when the queue limit would be exceeded.
     */
    [[nodiscard]] result<void> enqueue(std::vector<std::byte>&& encoded);

    /**
     * @brief Write every queued frame.
     *
     * Not cancellable; bounded by `writer_limits::send_timeout`, after which
     * it fails with `ETIMEDOUT`. A failed flush leaves the writer broken:
     * every later `enqueue()` and `flush()` reports the same error.
     */
    [[nodiscard]] runtime::task<result<void>> flush();

    /// @return Total bytes currently queued.
    [[nodiscard]] std::size_t queued_bytes() const noexcept;
    /// @return `true` while a `flush()` is writing.
    [[nodiscard]] bool flushing() const noexcept;

private:
    class turn_awaitable;

    void pass_turn() noexcept;

    streampump::nonblocking::tcp_stream& stream_;
    writer_limits limits_{};
    std::deque<std::vector<std::byte>> queue_{};
    std::size_t front_offset_{0};
    std::size_t queued_bytes_{0};
    bool flushing_{false};
    std::optional<error> failure_{};
    std::deque<std::pair<std::coroutine_handle<>, runtime::scheduler *>>
        waiting_{};
};

} // namespace streampump::ws

#include "streampump/ws/frame_writer.hpp"

#include "streampump/runtime/io_ops.hpp"

#include <cerrno>
#include <chrono>
#include <stdexcept>

namespace streampump::ws {

class frame_writer::turn_awaitable {
public:
    explicit turn_awaitable(frame_writer& writer) noexcept : writer_(writer) {}

    [[nodiscard]] bool await_ready() const noexcept {
        return !writer_.flushing_;
    }

    template <class Promise>
    void await_suspend(std::coroutine_handle<Promise> handle) {
        runtime::scheduler *sched = nullptr;
        if constexpr (requires(Promise& p) { p.scheduler_ptr(); }) {
            sched = handle.promise().scheduler_ptr();
        }
        if (sched == nullptr) {
            throw std::logic_error("frame_writer::flush requires a scheduler");
        }
        writer_.waiting_.emplace_back(handle, sched);
    }

    void await_resume() const noexcept {}

private:
    frame_writer& writer_;
};

frame_writer::frame_writer(streampump::nonblocking::tcp_stream& stream,
                           writer_limits limits) noexcept
    : stream_(stream), limits_(limits) {
    if (limits_.max_queued_bytes == 0) {
        limits_.max_queued_bytes = 1;
    }
}

result<void> frame_writer::enqueue(std::vector<std::byte>&& encoded) {
    if (!stream_.valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (failure_.has_value()) {
        return err<void>(*failure_);
    }
    if (encoded.empty()) {
        return ok();
    }
    if (queued_bytes_ + encoded.size() > limits_.max_queued_bytes &&
        queued_bytes_ > 0) {
        return err<void>(make_error_from_errno(EWOULDBLOCK));
    }

    queued_bytes_ += encoded.size();
    queue_.push_back(std::move(encoded));
    return ok();
}

runtime::task<result<void>> frame_writer::flush() {
    while (flushing_) {
        co_await turn_awaitable{*this};
    }
    if (failure_.has_value()) {
        co_return err<void>(*failure_);
    }
    if (queued_bytes_ == 0) {
        co_return ok();
    }

    flushing_ = true;
    const auto deadline =
        std::chrono::steady_clock::now() + limits_.send_timeout;

    result<void> status = ok();
    while (queued_bytes_ > 0) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            status = err<void>(make_error_from_errno(ETIMEDOUT));
            break;
        }

        auto& front = queue_.front();
        const auto remaining_span = std::span<const std::byte>{
            front.data() + front_offset_, front.size() - front_offset_};

        auto write_result = co_await runtime::async_write_some_with_timeout(
            stream_, remaining_span,
            std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
        if (!write_result.has_value()) {
            status = err<void>(write_result.error());
            break;
        }
        if (write_result.value() == 0U) {
            status = err<void>(make_error_from_errno(EPIPE));
            break;
        }

        front_offset_ += write_result.value();
        queued_bytes_ -= write_result.value();
        if (front_offset_ == front.size()) {
            queue_.pop_front();
            front_offset_ = 0;
        }
    }

    if (!status.has_value()) {
        // A frame may be half written; nothing queued behind it can be sent.
        queue_.clear();
        front_offset_ = 0;
        queued_bytes_ = 0;
        failure_ = status.error();
    }

    flushing_ = false;
    pass_turn();
    co_return status;
}

std::size_t frame_writer::queued_bytes() const noexcept {
    return queued_bytes_;
}

bool frame_writer::flushing() const noexcept {
    return flushing_;
}

void frame_writer::pass_turn() noexcept {
    if (waiting_.empty()) {
        return;
    }
    const auto [handle, sched] = waiting_.front();
    waiting_.pop_front();
    sched->schedule(handle);
}

} // namespace streampump::ws

#include "streampump/runtime/io_ops.hpp"

#include <cerrno>
#include <chrono>
#include <optional>
#include <utility>

namespace {

using streampump::runtime::cancel_registration;
using streampump::runtime::cancel_token;
using streampump::runtime::scheduler;

enum class wait_kind {
    readable,
    writable,
    deadline,
};

/**
 * Parks the coroutine in the scheduler and, when a token is supplied, links
 * the token to `scheduler::cancel_wait` for the duration of the wait.
 */
class parked_wait_awaitable {
public:
    parked_wait_awaitable(int fd, bool readable,
                          std::optional<std::chrono::milliseconds> timeout,
                          cancel_token token) noexcept
        : kind_(readable ? wait_kind::readable : wait_kind::writable), fd_(fd),
          timeout_(timeout), token_(std::move(token)) {}

    parked_wait_awaitable(std::chrono::steady_clock::time_point deadline,
                          cancel_token token) noexcept
        : kind_(wait_kind::deadline), deadline_(deadline),
          token_(std::move(token)) {}

    parked_wait_awaitable(const parked_wait_awaitable&) = delete;
    parked_wait_awaitable& operator=(const parked_wait_awaitable&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return false;
    }

    template <class Promise>
    bool await_suspend(std::coroutine_handle<Promise> handle) {
        if constexpr (!requires(Promise& p) { p.scheduler_ptr(); }) {
            status_ = streampump::err<void>(
                streampump::make_error_from_errno(EINVAL));
            return false;
        } else {
            scheduler_ = handle.promise().scheduler_ptr();
            handle_ = handle;

            if (scheduler_ == nullptr) {
                status_ = streampump::err<void>(
                    streampump::make_error_from_errno(EINVAL));
                return false;
            }
            if (token_.stop_requested()) {
                status_ = streampump::err<void>(
                    streampump::make_error_from_errno(ECANCELED));
                return false;
            }

            status_ = park(handle);
            if (!status_.has_value()) {
                return false;
            }

            if (token_.stop_possible()) {
                registration_.emplace(token_, [sched = scheduler_, handle]() {
                    sched->cancel_wait(
                        handle, streampump::make_error_from_errno(ECANCELED));
                });
            }
            return true;
        }
    }

    [[nodiscard]] streampump::result<void> await_resume() noexcept {
        registration_.reset();
        if (!status_.has_value()) {
            return status_;
        }

        if (scheduler_ == nullptr || !handle_) {
            return status_;
        }
        return scheduler_->consume_wait_result(handle_);
    }

private:
    [[nodiscard]] streampump::result<void>
    park(std::coroutine_handle<> handle) noexcept {
        const auto timeout_error = streampump::make_error_from_errno(ETIMEDOUT);
        switch (kind_) {
        case wait_kind::readable:
            return scheduler_->wait_for_readable(fd_, handle, timeout_,
                                                 timeout_error);
        case wait_kind::writable:
            return scheduler_->wait_for_writable(fd_, handle, timeout_,
                                                 timeout_error);
        case wait_kind::deadline:
            return scheduler_->wait_until(deadline_, handle);
        }
        return streampump::err<void>(streampump::make_error_from_errno(EINVAL));
    }

    wait_kind kind_{wait_kind::readable};
    int fd_{-1};
    std::optional<std::chrono::milliseconds> timeout_{};
    std::chrono::steady_clock::time_point deadline_{};
    cancel_token token_{};
    scheduler *scheduler_{nullptr};
    std::coroutine_handle<> handle_{};
    std::optional<cancel_registration> registration_{};
    streampump::result<void> status_{streampump::ok()};
};

[[nodiscard]] bool is_timeout_error(const streampump::error& err) noexcept {
    return err.is_errno(ETIMEDOUT);
}

} // namespace

namespace streampump::runtime {

task<result<void>> wait_readable(int fd, cancel_token token) {
    const auto status = co_await parked_wait_awaitable{
        fd, true, std::nullopt, std::move(token)};
    co_return status;
}

task<result<void>> wait_writable(int fd, cancel_token token) {
    const auto status = co_await parked_wait_awaitable{
        fd, false, std::nullopt, std::move(token)};
    co_return status;
}

task<result<void>> wait_readable_for(int fd, std::chrono::milliseconds timeout,
                                     cancel_token token) {
    const auto status = co_await parked_wait_awaitable{
        fd, true, timeout, std::move(token)};
    co_return status;
}

task<result<void>> wait_writable_for(int fd, std::chrono::milliseconds timeout,
                                     cancel_token token) {
    const auto status = co_await parked_wait_awaitable{
        fd, false, timeout, std::move(token)};
    co_return status;
}

task<result<void>> async_sleep(std::chrono::milliseconds duration,
                               cancel_token token) {
    if (token.stop_requested()) {
        co_return err<void>(make_error_from_errno(ECANCELED));
    }
    if (duration <= std::chrono::milliseconds{0}) {
        co_return ok();
    }

    const auto status = co_await parked_wait_awaitable{
        std::chrono::steady_clock::now() + duration, std::move(token)};
    co_return status;
}

task<result<void>> wait_for_cancel(cancel_token token) {
    if (!token.stop_possible()) {
        co_return err<void>(make_error_from_errno(EINVAL));
    }

    const auto status = co_await parked_wait_awaitable{
        std::chrono::steady_clock::time_point::max(), std::move(token)};
    if (status.has_value()) {
        co_return err<void>(make_error_from_errno(ECANCELED));
    }
    co_return status;
}

task<result<streampump::nonblocking::tcp_stream>>
async_accept(streampump::nonblocking::tcp_listener& listener,
             cancel_token token) {
    while (true) {
        if (token.stop_requested()) {
            co_return err<streampump::nonblocking::tcp_stream>(
                make_error_from_errno(ECANCELED));
        }

        auto accept_result = listener.accept();
        if (accept_result.has_value()) {
            co_return accept_result;
        }

        if (!streampump::nonblocking::is_would_block(accept_result.error())) {
            co_return err<streampump::nonblocking::tcp_stream>(
                accept_result.error());
        }

        const auto wait_result =
            co_await wait_readable(listener.native_handle(), token);
        if (!wait_result.has_value()) {
            co_return err<streampump::nonblocking::tcp_stream>(
                wait_result.error());
        }
    }
}

task<result<std::size_t>>
async_read_some(streampump::nonblocking::tcp_stream& stream,
                std::span<std::byte> buffer, cancel_token token) {
    while (true) {
        if (token.stop_requested()) {
            co_return err<std::size_t>(make_error_from_errno(ECANCELED));
        }

        auto read_result = stream.read_some(buffer);
        if (read_result.has_value()) {
            co_return read_result;
        }

        if (!streampump::nonblocking::is_would_block(read_result.error())) {
            co_return err<std::size_t>(read_result.error());
        }

        const auto wait_result =
            co_await wait_readable(stream.native_handle(), token);
        if (!wait_result.has_value()) {
            co_return err<std::size_t>(wait_result.error());
        }
    }
}

task<result<std::size_t>> async_write_some_with_timeout(
    streampump::nonblocking::tcp_stream& stream,
    std::span<const std::byte> buffer, std::chrono::milliseconds timeout,
    cancel_token token) {
    if (timeout < std::chrono::milliseconds{0}) {
        co_return err<std::size_t>(make_error_from_errno(EINVAL));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (token.stop_requested()) {
            co_return err<std::size_t>(make_error_from_errno(ECANCELED));
        }

        auto write_result = stream.write_some(buffer);
        if (write_result.has_value()) {
            co_return write_result;
        }

        if (!streampump::nonblocking::is_would_block(write_result.error())) {
            co_return err<std::size_t>(write_result.error());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            co_return err<std::size_t>(make_error_from_errno(ETIMEDOUT));
        }

        const auto remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        const auto wait_result =
            co_await wait_writable_for(stream.native_handle(), remaining, token);
        if (!wait_result.has_value() &&
            !is_timeout_error(wait_result.error())) {
            co_return err<std::size_t>(wait_result.error());
        }
    }
}

} // namespace streampump::runtime

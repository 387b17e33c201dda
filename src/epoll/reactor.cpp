#include "streampump/epoll/reactor.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <utility>

namespace {

[[nodiscard]] int to_epoll_timeout(std::chrono::milliseconds timeout) noexcept {
    if (timeout.count() < 0) {
        return -1;
    }
    return static_cast<int>(std::min<std::chrono::milliseconds::rep>(
        timeout.count(), std::numeric_limits<int>::max()));
}

} // namespace

namespace streampump::epoll {

reactor::reactor(streampump::unique_fd epoll_fd, std::size_t batch)
    : epoll_fd_(std::move(epoll_fd)), raw_(batch), ready_() {
    ready_.reserve(batch);
}

result<reactor> reactor::create(std::size_t batch) {
    const int fd = ::epoll_create1(EPOLL_CLOEXEC);
    if (fd < 0) {
        return err<reactor>(error::from_errno());
    }
    return reactor{streampump::unique_fd{fd}, std::max<std::size_t>(batch, 1)};
}

result<void> reactor::add(int fd, std::uint32_t events) noexcept {
    auto added = control(EPOLL_CTL_ADD, fd, events);
    if (added.has_value()) {
        ++watched_;
    }
    return added;
}

result<void> reactor::modify(int fd, std::uint32_t events) noexcept {
    return control(EPOLL_CTL_MOD, fd, events);
}

result<void> reactor::remove(int fd) noexcept {
    auto removed = control(EPOLL_CTL_DEL, fd, 0);
    if (removed.has_value() && watched_ > 0) {
        --watched_;
    }
    return removed;
}

result<std::span<const ready_event>>
reactor::wait(std::chrono::milliseconds timeout) noexcept {
    using span_type = std::span<const ready_event>;
    if (!valid()) {
        return err<span_type>(make_error_from_errno(EBADF));
    }

    ready_.clear();
    const int count = ::epoll_wait(epoll_fd_.get(), raw_.data(),
                                   static_cast<int>(raw_.size()),
                                   to_epoll_timeout(timeout));
    if (count < 0) {
        if (errno == EINTR) {
            return span_type{};
        }
        return err<span_type>(error::from_errno());
    }

    for (const auto& raw : std::span{raw_}.first(static_cast<std::size_t>(count))) {
        ready_.push_back(ready_event{raw.data.fd, raw.events});
    }
    return span_type{ready_};
}

std::size_t reactor::watched() const noexcept {
    return watched_;
}

int reactor::native_handle() const noexcept {
    return epoll_fd_.get();
}

bool reactor::valid() const noexcept {
    return epoll_fd_.valid();
}

result<void> reactor::control(int operation, int fd, std::uint32_t events) noexcept {
    if (!valid() || fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }

    ::epoll_event interest{};
    interest.events = events;
    interest.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), operation, fd, &interest) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

} // namespace streampump::epoll

#include "streampump/blocking/tcp.hpp"

#include "socket_ops.hpp"

#include <cerrno>
#include <sys/time.h>

namespace streampump::blocking {

tcp_stream::tcp_stream(streampump::unique_fd fd) noexcept : fd_(std::move(fd)) {}

result<tcp_stream> tcp_stream::connect(const endpoint& remote) noexcept {
    const auto addr = detail::to_sockaddr(remote);
    if (!addr.has_value()) {
        return err<tcp_stream>(addr.error());
    }
    auto socket = detail::open_tcp_socket(0);
    if (!socket.has_value()) {
        return err<tcp_stream>(socket.error());
    }

    if (::connect(socket->get(), reinterpret_cast<const sockaddr *>(&addr.value()),
                  sizeof(sockaddr_in)) != 0) {
        return err<tcp_stream>(error::from_errno());
    }
    return tcp_stream{std::move(socket.value())};
}

result<std::size_t> tcp_stream::read_some(std::span<std::byte> buffer) noexcept {
    return detail::recv_some(fd_.get(), buffer);
}

result<std::size_t> tcp_stream::write_some(std::span<const std::byte> buffer) noexcept {
    return detail::send_some(fd_.get(), buffer);
}

result<void> tcp_stream::shutdown_write() noexcept {
    return detail::shutdown_write(fd_.get());
}

result<void>
tcp_stream::set_receive_timeout(std::chrono::milliseconds timeout) noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (timeout.count() < 0) {
        return err<void>(make_error_from_errno(EINVAL));
    }

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
    timeval limit{};
    limit.tv_sec = static_cast<time_t>(seconds.count());
    limit.tv_usec = static_cast<suseconds_t>(micros.count());
    return detail::set_option(fd_.get(), SOL_SOCKET, SO_RCVTIMEO, limit);
}

int tcp_stream::native_handle() const noexcept {
    return fd_.get();
}

bool tcp_stream::valid() const noexcept {
    return fd_.valid();
}

result<void> write_all(tcp_stream& stream, std::span<const std::byte> buffer) noexcept {
    while (!buffer.empty()) {
        const auto written = stream.write_some(buffer);
        if (!written.has_value()) {
            return err<void>(written.error());
        }
        if (written.value() == 0) {
            return err<void>(make_error_from_errno(EPIPE));
        }
        buffer = buffer.subspan(written.value());
    }
    return ok();
}

result<void> read_exact(tcp_stream& stream, std::span<std::byte> buffer) noexcept {
    while (!buffer.empty()) {
        const auto received = stream.read_some(buffer);
        if (!received.has_value()) {
            return err<void>(received.error());
        }
        if (received.value() == 0) {
            return err<void>(make_error_from_errno(ECONNRESET));
        }
        buffer = buffer.subspan(received.value());
    }
    return ok();
}

} // namespace streampump::blocking

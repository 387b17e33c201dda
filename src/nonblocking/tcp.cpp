#include "streampump/nonblocking/tcp.hpp"

#include "../blocking/socket_ops.hpp"

#include <cerrno>

namespace streampump::nonblocking {

tcp_stream::tcp_stream(streampump::unique_fd fd) noexcept : fd_(std::move(fd)) {}

result<std::size_t> tcp_stream::read_some(std::span<std::byte> buffer) noexcept {
    return detail::recv_some(fd_.get(), buffer);
}

result<std::size_t> tcp_stream::write_some(std::span<const std::byte> buffer) noexcept {
    return detail::send_some(fd_.get(), buffer);
}

result<void> tcp_stream::shutdown_write() noexcept {
    return detail::shutdown_write(fd_.get());
}

void tcp_stream::close() noexcept {
    fd_.reset();
}

int tcp_stream::native_handle() const noexcept {
    return fd_.get();
}

bool tcp_stream::valid() const noexcept {
    return fd_.valid();
}

tcp_listener::tcp_listener(streampump::unique_fd fd) noexcept : fd_(std::move(fd)) {}

result<tcp_listener> tcp_listener::bind(const endpoint& local, int backlog) noexcept {
    const auto addr = detail::to_sockaddr(local);
    if (!addr.has_value()) {
        return err<tcp_listener>(addr.error());
    }
    auto socket = detail::open_tcp_socket(SOCK_NONBLOCK);
    if (!socket.has_value()) {
        return err<tcp_listener>(socket.error());
    }

    const int fd = socket->get();
    const auto reuse = detail::set_option(fd, SOL_SOCKET, SO_REUSEADDR, 1);
    if (!reuse.has_value()) {
        return err<tcp_listener>(reuse.error());
    }
    if (::bind(fd, reinterpret_cast<const sockaddr *>(&addr.value()),
               sizeof(sockaddr_in)) != 0) {
        return err<tcp_listener>(error::from_errno());
    }
    if (::listen(fd, backlog) != 0) {
        return err<tcp_listener>(error::from_errno());
    }
    return tcp_listener{std::move(socket.value())};
}

result<tcp_stream> tcp_listener::accept() noexcept {
    if (!valid()) {
        return err<tcp_stream>(make_error_from_errno(EBADF));
    }
    const int fd = ::accept4(fd_.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (fd < 0) {
        return err<tcp_stream>(error::from_errno());
    }
    return tcp_stream{streampump::unique_fd{fd}};
}

result<std::uint16_t> tcp_listener::local_port() const noexcept {
    if (!valid()) {
        return err<std::uint16_t>(make_error_from_errno(EBADF));
    }
    sockaddr_in addr{};
    auto length = static_cast<socklen_t>(sizeof(addr));
    if (::getsockname(fd_.get(), reinterpret_cast<sockaddr *>(&addr), &length) != 0) {
        return err<std::uint16_t>(error::from_errno());
    }
    return ntohs(addr.sin_port);
}

int tcp_listener::native_handle() const noexcept {
    return fd_.get();
}

bool tcp_listener::valid() const noexcept {
    return fd_.valid();
}

bool is_would_block(const streampump::error& err) noexcept {
    return err.is_errno(EAGAIN) || err.is_errno(EWOULDBLOCK);
}

} // namespace streampump::nonblocking

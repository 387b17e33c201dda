#include "socket_ops.hpp"

#include <arpa/inet.h>
#include <cerrno>

namespace streampump::detail {

result<sockaddr_in> to_sockaddr(const blocking::endpoint& ep) noexcept {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(ep.port);
    if (::inet_pton(AF_INET, ep.host.c_str(), &addr.sin_addr) != 1) {
        return err<sockaddr_in>(make_error_from_errno(EINVAL));
    }
    return addr;
}

result<unique_fd> open_tcp_socket(int flags) noexcept {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | flags, 0);
    if (fd < 0) {
        return err<unique_fd>(error::from_errno());
    }
    return unique_fd{fd};
}

result<std::size_t> recv_some(int fd, std::span<std::byte> buffer) noexcept {
    if (fd < 0) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return std::size_t{0};
    }
    while (true) {
        const ssize_t count = ::recv(fd, buffer.data(), buffer.size(), 0);
        if (count >= 0) {
            return static_cast<std::size_t>(count);
        }
        if (errno != EINTR) {
            return err<std::size_t>(error::from_errno());
        }
    }
}

result<std::size_t> send_some(int fd, std::span<const std::byte> buffer) noexcept {
    if (fd < 0) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return std::size_t{0};
    }
    while (true) {
        const ssize_t count = ::send(fd, buffer.data(), buffer.size(), MSG_NOSIGNAL);
        if (count >= 0) {
            return static_cast<std::size_t>(count);
        }
        if (errno != EINTR) {
            return err<std::size_t>(error::from_errno());
        }
    }
}

result<void> shutdown_write(int fd) noexcept {
    if (fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (::shutdown(fd, SHUT_WR) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

} // namespace streampump::detail

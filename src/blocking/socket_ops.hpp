#pragma once

// Socket calls shared by the blocking and nonblocking TCP types.

#include "streampump/blocking/endpoint.hpp"
#include "streampump/core/result.hpp"
#include "streampump/core/unique_fd.hpp"

#include <cstddef>
#include <netinet/in.h>
#include <span>
#include <sys/socket.h>

namespace streampump::detail {

[[nodiscard]] result<sockaddr_in> to_sockaddr(const blocking::endpoint& ep) noexcept;

/// @param flags Extra `socket(2)` type flags such as `SOCK_NONBLOCK`.
[[nodiscard]] result<unique_fd> open_tcp_socket(int flags) noexcept;

/// `recv(2)` restarted on `EINTR`; `0` means the peer shut down its side.
[[nodiscard]] result<std::size_t> recv_some(int fd, std::span<std::byte> buffer) noexcept;
/// `send(2)` without `SIGPIPE`, restarted on `EINTR`.
[[nodiscard]] result<std::size_t> send_some(int fd,
                                            std::span<const std::byte> buffer) noexcept;
[[nodiscard]] result<void> shutdown_write(int fd) noexcept;

template <class T>
[[nodiscard]] result<void> set_option(int fd, int level, int name, const T& value) noexcept {
    if (::setsockopt(fd, level, name, &value, sizeof(value)) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

} // namespace streampump::detail

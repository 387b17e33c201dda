#include "streampump/core/unique_fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace streampump {

void unique_fd::reset(int fd) noexcept {
    if (fd_ == fd) {
        return;
    }
    if (valid()) {
        // The descriptor is gone either way; nothing to retry after EINTR.
        static_cast<void>(::close(fd_));
    }
    fd_ = fd;
}

result<void> unique_fd::close() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (::close(release()) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

} // namespace streampump

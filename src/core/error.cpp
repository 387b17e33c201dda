#include "streampump/core/error.hpp"

#include "streampump/core/errc.hpp"

namespace streampump {

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::string error::message() const {
    if (code_.category() == errc_category()) {
        return code_.message();
    }
    return code_.message() + " (errno " + std::to_string(code_.value()) + ")";
}

bool error::is(errc value) const noexcept {
    return code_ == make_error_code(value);
}

bool error::is_errno(int value) const noexcept {
    return code_.category() == std::system_category() && code_.value() == value;
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

} // namespace streampump

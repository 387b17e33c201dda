#include "streampump/runtime/cancel.hpp"

namespace streampump::runtime {

namespace detail {

std::uint64_t cancel_state::add_callback(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (!stopped_.load(std::memory_order_acquire)) {
            const auto id = next_id_++;
            callbacks_.emplace_back(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void cancel_state::remove_callback(std::uint64_t id) noexcept {
    std::lock_guard<std::mutex> lock{mutex_};
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
        if (it->first == id) {
            callbacks_.erase(it);
            return;
        }
    }
}

bool cancel_state::request_stop() {
    std::vector<std::pair<std::uint64_t, std::function<void()>>> pending{};
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopped_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
        pending.swap(callbacks_);
    }

    for (auto& entry : pending) {
        entry.second();
    }
    return true;
}

} // namespace detail

cancel_registration::cancel_registration(const cancel_token& token,
                                         std::function<void()> callback)
    : state_(token.state_) {
    if (state_ == nullptr) {
        return;
    }
    id_ = state_->add_callback(std::move(callback));
}

cancel_registration::~cancel_registration() {
    if (state_ != nullptr && id_ != 0) {
        state_->remove_callback(id_);
    }
}

cancel_source::cancel_source()
    : state_(std::make_shared<detail::cancel_state>()) {}

cancel_source::cancel_source(const cancel_token& parent)
    : state_(std::make_shared<detail::cancel_state>()) {
    if (!parent.stop_possible()) {
        return;
    }

    std::weak_ptr<detail::cancel_state> weak = state_;
    parent_link_ = std::make_unique<cancel_registration>(parent, [weak]() {
        if (auto state = weak.lock()) {
            state->request_stop();
        }
    });
}

void cancel_source::request_stop() const {
    state_->request_stop();
}

} // namespace streampump::runtime

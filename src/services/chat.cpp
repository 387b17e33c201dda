#include "streampump/services/chat.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <utility>

namespace streampump::services {

std::string encode_chat_event(const chat_event& event) {
    nlohmann::json document;
    document["username"] = event.username;
    document["message"] = event.message;
    return document.dump();
}

result<chat_event> decode_chat_event(std::string_view json_text) {
    const auto document = nlohmann::json::parse(json_text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return err<chat_event>(make_error_from_errno(EBADMSG));
    }

    const auto username = document.find("username");
    const auto message = document.find("message");
    if (username == document.end() || !username->is_string() ||
        message == document.end() || !message->is_string()) {
        return err<chat_event>(make_error_from_errno(EBADMSG));
    }
    return chat_event{username->get<std::string>(), message->get<std::string>()};
}

broadcast_hub::subscription::subscription(broadcast_hub& hub,
                                          std::shared_ptr<inbox> box) noexcept
    : hub_(&hub), inbox_(std::move(box)) {}

broadcast_hub::subscription::~subscription() {
    reset();
}

broadcast_hub::subscription::subscription(subscription&& other) noexcept
    : hub_(std::exchange(other.hub_, nullptr)),
      inbox_(std::move(other.inbox_)) {}

broadcast_hub::subscription&
broadcast_hub::subscription::operator=(subscription&& other) noexcept {
    if (this != &other) {
        reset();
        hub_ = std::exchange(other.hub_, nullptr);
        inbox_ = std::move(other.inbox_);
    }
    return *this;
}

std::uint64_t broadcast_hub::subscription::id() const noexcept {
    return inbox_ ? inbox_->id : 0;
}

const std::string& broadcast_hub::subscription::username() const noexcept {
    static const std::string empty;
    return inbox_ ? inbox_->username : empty;
}

pipeline::bounded_channel<chat_event>&
broadcast_hub::subscription::events() noexcept {
    return inbox_->channel;
}

bool broadcast_hub::subscription::valid() const noexcept {
    return hub_ != nullptr && inbox_ != nullptr;
}

void broadcast_hub::subscription::reset() noexcept {
    if (hub_ != nullptr && inbox_ != nullptr) {
        hub_->unsubscribe(inbox_->id);
    }
    hub_ = nullptr;
    inbox_.reset();
}

broadcast_hub::broadcast_hub(std::size_t inbox_capacity)
    : inbox_capacity_(inbox_capacity) {
    if (inbox_capacity_ == 0) {
        throw std::invalid_argument("broadcast_hub inbox capacity must be >= 1");
    }
}

broadcast_hub::subscription broadcast_hub::subscribe(std::string username) {
    auto box = std::make_shared<inbox>(next_id_++, std::move(username),
                                       inbox_capacity_);
    inboxes_.push_back(box);
    return subscription{*this, std::move(box)};
}

std::size_t broadcast_hub::publish(const chat_event& event,
                                   std::uint64_t origin) {
    std::size_t delivered = 0;
    for (const auto& box : inboxes_) {
        if (box->id == origin) {
            continue;
        }
        const auto outcome = box->channel.try_push(event);
        if (outcome != pipeline::push_outcome::closed &&
            outcome != pipeline::push_outcome::dropped_newest) {
            ++delivered;
        }
    }
    return delivered;
}

std::size_t broadcast_hub::subscribers() const noexcept {
    return inboxes_.size();
}

void broadcast_hub::unsubscribe(std::uint64_t id) noexcept {
    const auto it = std::find_if(
        inboxes_.begin(), inboxes_.end(),
        [id](const std::shared_ptr<inbox>& box) { return box->id == id; });
    if (it == inboxes_.end()) {
        return;
    }
    (*it)->channel.close();
    inboxes_.erase(it);
}

} // namespace streampump::services

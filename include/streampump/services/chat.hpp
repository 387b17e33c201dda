#pragma once

/**
 * @file
 * @brief In-process broadcast hub and chat event encoding.
 */

#include "streampump/core/result.hpp"
#include "streampump/pipeline/bounded_channel.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace streampump::services {

/// @brief One chat line, sent as `{"username":...,"message":...}`.
struct chat_event {
    std::string username{};
    std::string message{};
};

[[nodiscard]] std::string encode_chat_event(const chat_event& event);

/// @return `EBADMSG` unless both fields are present strings.
[[nodiscard]] result<chat_event> decode_chat_event(std::string_view json_text);

/**
 * @brief Fans chat events out to every subscriber's inbox.
 *
 * Each inbox is a bounded channel that drops its oldest event when a slow
 * reader falls behind. Not thread-safe: use from the loop thread only.
 */
class broadcast_hub {
    struct inbox {
        inbox(std::uint64_t id_value, std::string name, std::size_t capacity)
            : id(id_value), username(std::move(name)),
              channel(capacity, pipeline::overflow_policy::drop_oldest) {}

        std::uint64_t id;
        std::string username;
        pipeline::bounded_channel<chat_event> channel;
    };

public:
    /// @brief Membership in the hub; leaving scope unsubscribes.
    class subscription {
    public:
        subscription() noexcept = default;
        ~subscription();

        subscription(const subscription&) = delete;
        subscription& operator=(const subscription&) = delete;
        subscription(subscription&& other) noexcept;
        subscription& operator=(subscription&& other) noexcept;

        [[nodiscard]] std::uint64_t id() const noexcept;
        [[nodiscard]] const std::string& username() const noexcept;
        /// @brief Events published by other subscribers.
        [[nodiscard]] pipeline::bounded_channel<chat_event>& events() noexcept;
        [[nodiscard]] bool valid() const noexcept;

    private:
        friend class broadcast_hub;
        subscription(broadcast_hub& hub, std::shared_ptr<inbox> box) noexcept;

        void reset() noexcept;

        broadcast_hub *hub_{nullptr};
        std::shared_ptr<inbox> inbox_{};
    };

    /// @throws std::invalid_argument when `inbox_capacity` is zero.
    explicit broadcast_hub(std::size_t inbox_capacity = 16);

    broadcast_hub(const broadcast_hub&) = delete;
    broadcast_hub& operator=(const broadcast_hub&) = delete;

    [[nodiscard]] subscription subscribe(std::string username);

    /**
     * @brief Deliver `event` to every inbox except the publisher's.
     * @param origin Publishing subscription id, `0` for none.
     * @return Number of inboxes the event was pushed to.
     */
    std::size_t publish(const chat_event& event, std::uint64_t origin = 0);

    [[nodiscard]] std::size_t subscribers() const noexcept;

private:
    void unsubscribe(std::uint64_t id) noexcept;

    std::size_t inbox_capacity_{16};
    std::uint64_t next_id_{1};
    std::vector<std::shared_ptr<inbox>> inboxes_{};
};

} // namespace streampump::services

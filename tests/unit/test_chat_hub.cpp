#include "streampump/services/chat.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>

namespace {

namespace services = streampump::services;

TEST(chat_hub_test, chat_event_json_round_trips) {
    const auto text = services::encode_chat_event({"ann", "hi \"there\""});
    const auto decoded = services::decode_chat_event(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->username, "ann");
    EXPECT_EQ(decoded->message, "hi \"there\"");

    const auto missing = services::decode_chat_event(R"({"username":"ann"})");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().value(), EBADMSG);
    EXPECT_FALSE(services::decode_chat_event("not json").has_value());
}

TEST(chat_hub_test, publish_skips_the_origin) {
    services::broadcast_hub hub;
    auto ann = hub.subscribe("ann");
    auto bob = hub.subscribe("bob");
    ASSERT_TRUE(ann.valid());
    EXPECT_NE(ann.id(), bob.id());
    EXPECT_EQ(hub.subscribers(), 2U);

    EXPECT_EQ(hub.publish({"ann", "hello"}, ann.id()), 1U);
    EXPECT_EQ(ann.events().size(), 0U);
    auto received = bob.events().try_pop();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->username, "ann");
    EXPECT_EQ(received->message, "hello");

    EXPECT_EQ(hub.publish({"server", "notice"}), 2U);
}

TEST(chat_hub_test, same_username_in_two_sessions_still_receives) {
    services::broadcast_hub hub;
    auto first = hub.subscribe("ann");
    auto second = hub.subscribe("ann");

    EXPECT_EQ(hub.publish({"ann", "from first"}, first.id()), 1U);
    EXPECT_EQ(second.events().size(), 1U);
}

TEST(chat_hub_test, slow_reader_keeps_most_recent_events) {
    services::broadcast_hub hub{2};
    auto reader = hub.subscribe("reader");
    for (const auto *line : {"one", "two", "three"}) {
        hub.publish({"writer", line});
    }

    EXPECT_EQ(reader.events().dropped(), 1U);
    EXPECT_EQ(reader.events().try_pop()->message, "two");
    EXPECT_EQ(reader.events().try_pop()->message, "three");
}

TEST(chat_hub_test, leaving_scope_unsubscribes) {
    services::broadcast_hub hub;
    auto stays = hub.subscribe("stays");
    {
        auto leaves = hub.subscribe("leaves");
        EXPECT_EQ(hub.subscribers(), 2U);
    }
    EXPECT_EQ(hub.subscribers(), 1U);

    auto moved = std::move(stays);
    EXPECT_FALSE(stays.valid());
    EXPECT_TRUE(moved.valid());
    EXPECT_EQ(hub.subscribers(), 1U);
    EXPECT_EQ(moved.username(), "stays");
}

TEST(chat_hub_test, zero_capacity_is_rejected) {
    EXPECT_THROW(services::broadcast_hub{0}, std::invalid_argument);
}

} // namespace

#include "streampump/pipeline/bounded_channel.hpp"
#include "streampump/pipeline/message.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace {

using streampump::pipeline::bounded_channel;
using streampump::pipeline::message;
using streampump::pipeline::overflow_policy;
using streampump::pipeline::push_outcome;

TEST(bounded_channel_test, full_channel_drops_incoming_frame_by_default) {
    bounded_channel<message> channel;
    EXPECT_EQ(channel.capacity(), 1U);
    EXPECT_EQ(channel.policy(), overflow_policy::drop_newest);

    EXPECT_EQ(channel.try_push(message::text("A")), push_outcome::enqueued);
    EXPECT_EQ(channel.try_push(message::text("B")), push_outcome::dropped_newest);
    EXPECT_EQ(channel.size(), 1U);

    auto first = channel.try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->as_text(), "A");

    EXPECT_EQ(channel.try_push(message::text("C")), push_outcome::enqueued);
    auto second = channel.try_pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->as_text(), "C");

    EXPECT_EQ(channel.dropped(), 1U);
    EXPECT_EQ(channel.pushed(), 2U);
}

TEST(bounded_channel_test, drop_oldest_keeps_the_freshest_frame) {
    bounded_channel<message> channel{1, overflow_policy::drop_oldest};

    EXPECT_EQ(channel.try_push(message::text("A")), push_outcome::enqueued);
    EXPECT_EQ(channel.try_push(message::text("B")), push_outcome::dropped_oldest);
    EXPECT_TRUE(streampump::pipeline::is_drop(push_outcome::dropped_oldest));

    auto item = channel.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->as_text(), "B");
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(bounded_channel_test, size_never_exceeds_capacity_and_order_is_kept) {
    bounded_channel<int> channel{3};

    for (int i = 0; i < 10; ++i) {
        channel.try_push(i);
        EXPECT_LE(channel.size(), channel.capacity());
    }
    EXPECT_EQ(channel.dropped(), 7U);

    for (int expected = 0; expected < 3; ++expected) {
        auto item = channel.try_pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, expected);
    }
}

TEST(bounded_channel_test, closed_channel_rejects_pushes_but_drains) {
    bounded_channel<std::string> channel{2};
    EXPECT_EQ(channel.try_push("kept"), push_outcome::enqueued);

    channel.close();
    EXPECT_TRUE(channel.closed());
    EXPECT_EQ(channel.try_push("late"), push_outcome::closed);
    EXPECT_FALSE(streampump::pipeline::is_drop(push_outcome::closed));

    auto item = channel.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "kept");
    EXPECT_EQ(channel.dropped(), 0U);
}

TEST(bounded_channel_test, zero_capacity_is_rejected) {
    EXPECT_THROW(bounded_channel<int>{0}, std::invalid_argument);
}

} // namespace

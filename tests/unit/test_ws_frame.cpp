#include "streampump/core/errc.hpp"
#include "streampump/ws/frame.hpp"

#include <array>
#include <cstddef>
#include <gtest/gtest.h>
#include <string_view>
#include <vector>

namespace {

namespace ws = streampump::ws;

constexpr std::array<std::byte, 4> kMask{std::byte{0x37}, std::byte{0xFA},
                                         std::byte{0x21}, std::byte{0x3D}};

std::vector<std::byte> bytes_of(std::string_view text) {
    const auto view = std::as_bytes(std::span<const char>{text});
    return {view.begin(), view.end()};
}

ws::frame_decoder server_decoder(std::size_t max_message = 1024) {
    return ws::frame_decoder{ws::decode_limits{max_message, true}};
}

TEST(ws_frame_test, encodes_rfc_masked_hello_example) {
    const auto encoded = ws::encode_frame(ws::opcode::text, bytes_of("Hello"), kMask);
    const std::vector<std::byte> expected{
        std::byte{0x81}, std::byte{0x85}, std::byte{0x37}, std::byte{0xFA},
        std::byte{0x21}, std::byte{0x3D}, std::byte{0x7F}, std::byte{0x9F},
        std::byte{0x4D}, std::byte{0x51}, std::byte{0x58}};
    EXPECT_EQ(encoded, expected);
}

TEST(ws_frame_test, uses_extended_length_forms) {
    const std::vector<std::byte> medium(300, std::byte{0x01});
    const auto medium_frame = ws::encode_frame(ws::opcode::binary, medium);
    EXPECT_EQ(std::to_integer<int>(medium_frame[1]), 126);
    EXPECT_EQ(medium_frame.size(), 4U + medium.size());

    const std::vector<std::byte> large(70000, std::byte{0x02});
    const auto large_frame = ws::encode_frame(ws::opcode::binary, large);
    EXPECT_EQ(std::to_integer<int>(large_frame[1]), 127);
    EXPECT_EQ(large_frame.size(), 10U + large.size());
}

TEST(ws_frame_test, decodes_masked_message_split_across_feeds) {
    auto decoder = server_decoder();
    const auto encoded = ws::encode_frame(ws::opcode::text, bytes_of("Hello"), kMask);

    decoder.feed(std::span<const std::byte>{encoded}.first(3));
    auto partial = decoder.next();
    ASSERT_TRUE(partial.has_value());
    EXPECT_FALSE(partial->has_value());

    decoder.feed(std::span<const std::byte>{encoded}.subspan(3));
    auto complete = decoder.next();
    ASSERT_TRUE(complete.has_value());
    ASSERT_TRUE(complete->has_value());
    ASSERT_TRUE((*complete)->data.has_value());
    EXPECT_TRUE((*complete)->data->is_text());
    EXPECT_EQ((*complete)->data->as_text(), "Hello");
    EXPECT_EQ(decoder.buffered(), 0U);
}

TEST(ws_frame_test, reassembles_fragments_around_a_ping) {
    auto decoder = server_decoder();
    const auto first = ws::encode_frame(ws::opcode::text, bytes_of("Hel"), kMask, false);
    const auto ping = ws::encode_frame(ws::opcode::ping, bytes_of("p"), kMask);
    const auto last = ws::encode_frame(ws::opcode::continuation, bytes_of("lo"), kMask);
    decoder.feed(first);
    decoder.feed(ping);
    decoder.feed(last);

    auto control = decoder.next();
    ASSERT_TRUE(control.has_value());
    ASSERT_TRUE(control->has_value());
    ASSERT_TRUE((*control)->control.has_value());
    EXPECT_EQ((*control)->control->op, ws::opcode::ping);

    auto data = decoder.next();
    ASSERT_TRUE(data.has_value());
    ASSERT_TRUE(data->has_value());
    ASSERT_TRUE((*data)->data.has_value());
    EXPECT_EQ((*data)->data->as_text(), "Hello");
}

TEST(ws_frame_test, rejects_unmasked_client_frame) {
    auto decoder = server_decoder();
    decoder.feed(ws::encode_frame(ws::opcode::text, bytes_of("x")));

    const auto decoded = decoder.next();
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(streampump::errc::protocol_violation));
}

TEST(ws_frame_test, rejects_reserved_bits_and_orphan_continuation) {
    auto reserved = server_decoder();
    auto frame = ws::encode_frame(ws::opcode::binary, bytes_of("x"), kMask);
    frame[0] |= std::byte{0x40};
    reserved.feed(frame);
    EXPECT_FALSE(reserved.next().has_value());

    auto orphan = server_decoder();
    orphan.feed(ws::encode_frame(ws::opcode::continuation, bytes_of("x"), kMask));
    const auto decoded = orphan.next();
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(streampump::errc::protocol_violation));
}

TEST(ws_frame_test, rejects_fragmented_control_frame) {
    auto decoder = server_decoder();
    decoder.feed(ws::encode_frame(ws::opcode::ping, bytes_of("x"), kMask, false));
    const auto decoded = decoder.next();
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(streampump::errc::protocol_violation));
}

TEST(ws_frame_test, oversized_message_is_refused_before_its_body_arrives) {
    auto decoder = server_decoder(16);
    const std::vector<std::byte> body(64, std::byte{0x00});
    const auto encoded = ws::encode_frame(ws::opcode::binary, body, kMask);
    decoder.feed(std::span<const std::byte>{encoded}.first(8));

    const auto decoded = decoder.next();
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(streampump::errc::message_too_large));
}

TEST(ws_frame_test, close_payload_carries_code_and_reason) {
    const auto payload = ws::encode_close_payload(1001, "going away");
    EXPECT_EQ(ws::decode_close_code(payload), 1001);
    EXPECT_EQ(payload.size(), 2U + std::string_view{"going away"}.size());
    EXPECT_EQ(ws::decode_close_code({}), 1005);
}

TEST(ws_frame_test, client_side_decoder_accepts_unmasked_server_frames) {
    ws::frame_decoder decoder{ws::decode_limits{1024, false}};
    decoder.feed(ws::encode_frame(ws::opcode::binary, bytes_of("ok")));

    auto decoded = decoder.next();
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->has_value());
    ASSERT_TRUE((*decoded)->data.has_value());
    EXPECT_FALSE((*decoded)->data->is_text());
    EXPECT_EQ((*decoded)->data->to_string(), "ok");
}

} // namespace

#include "streampump/core/errc.hpp"
#include "streampump/ws/handshake.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

namespace ws = streampump::ws;

const std::string kRequest =
    "GET /echo?username=ann%20lee HTTP/1.1\r\n"
    "Host: 127.0.0.1:8000\r\n"
    "Upgrade: websocket\r\n"
    "Connection: keep-alive, Upgrade\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
    "Sec-WebSocket-Version: 13\r\n"
    "\r\n";

TEST(ws_handshake_test, computes_rfc_accept_key) {
    EXPECT_EQ(ws::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ=="),
              "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST(ws_handshake_test, parses_upgrade_request) {
    ASSERT_EQ(ws::find_header_end(kRequest), kRequest.size());

    const auto request = ws::parse_handshake_request(kRequest);
    ASSERT_TRUE(request.has_value()) << request.error().message();
    EXPECT_EQ(request->path, "/echo");
    EXPECT_EQ(request->query, "username=ann%20lee");
    EXPECT_EQ(request->key, "dGhlIHNhbXBsZSBub25jZQ==");
    EXPECT_EQ(request->headers.at("host"), "127.0.0.1:8000");

    const auto context = ws::make_context(*request);
    EXPECT_EQ(context.path, "/echo");
    EXPECT_EQ(context.username, "ann lee");
}

TEST(ws_handshake_test, username_defaults_to_anonymous) {
    ws::handshake_request request{};
    request.path = "/chat";
    EXPECT_EQ(ws::make_context(request).username, "Anonymous");
    EXPECT_EQ(ws::query_parameter("a=1&username=bo", "username"), "bo");
    EXPECT_EQ(ws::query_parameter("a=1", "username"), "");
}

TEST(ws_handshake_test, rejects_requests_that_are_not_upgrades) {
    const std::string plain_get =
        "GET /echo HTTP/1.1\r\nHost: x\r\n\r\n";
    const auto plain = ws::parse_handshake_request(plain_get);
    ASSERT_FALSE(plain.has_value());
    EXPECT_TRUE(plain.error().is(streampump::errc::handshake_failed));

    std::string old_version = kRequest;
    old_version.replace(old_version.find("Version: 13"), 11, "Version: 8");
    EXPECT_FALSE(ws::parse_handshake_request(old_version).has_value());

    std::string post = kRequest;
    post.replace(0, 3, "PUT");
    EXPECT_FALSE(ws::parse_handshake_request(post).has_value());

    EXPECT_EQ(ws::find_header_end("GET / HTTP/1.1\r\nHost: x\r\n"), 0U);
}

TEST(ws_handshake_test, accept_response_round_trips_through_client_validation) {
    const auto request = ws::parse_handshake_request(kRequest);
    ASSERT_TRUE(request.has_value());

    const auto response = ws::build_accept_response(*request);
    EXPECT_NE(response.find("101 Switching Protocols"), std::string::npos);
    EXPECT_TRUE(ws::validate_accept_response(response, request->key).has_value());

    const auto wrong_key = ws::validate_accept_response(response, "AAAAAAAAAAAAAAAAAAAAAA==");
    ASSERT_FALSE(wrong_key.has_value());
    EXPECT_TRUE(wrong_key.error().is(streampump::errc::handshake_failed));

    const auto refused = ws::validate_accept_response(
        ws::build_reject_response(404, "Not Found"), request->key);
    EXPECT_FALSE(refused.has_value());
}

TEST(ws_handshake_test, client_request_is_accepted_by_server_parser) {
    const auto key = ws::generate_client_key();
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->size(), 24U);

    const auto raw = ws::build_client_request("localhost:8000", "/chat?username=zoe", *key);
    const auto request = ws::parse_handshake_request(raw);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->key, *key);
    EXPECT_EQ(ws::make_context(*request).username, "zoe");
}

} // namespace

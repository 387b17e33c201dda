#include "streampump/blocking/endpoint.hpp"
#include "streampump/core/errc.hpp"
#include "streampump/services/detection.hpp"
#include "streampump/ws/blocking_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace sp = streampump;

bool parse_unsigned(const char *arg, unsigned long min, unsigned long max,
                    unsigned long& out) {
    try {
        std::size_t consumed = 0;
        const auto text = std::string{arg};
        const auto parsed = std::stoul(text, &consumed);
        if (consumed != text.size() || parsed < min || parsed > max) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// JPEG start-of-image marker followed by filler.
std::vector<std::byte> fake_jpeg(std::size_t size) {
    std::vector<std::byte> image(size < 4 ? 4 : size, std::byte{0x00});
    image[0] = std::byte{0xFF};
    image[1] = std::byte{0xD8};
    image[2] = std::byte{0xFF};
    image[3] = std::byte{0xE0};
    return image;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 4) {
        std::cerr << "usage: streampump_flood_client [host:port] [frames] "
                     "[frame_bytes]\n";
        return 2;
    }

    auto server = sp::blocking::endpoint::parse(argc > 1 ? argv[1] : "127.0.0.1:8000");
    unsigned long frames = 100;
    unsigned long frame_bytes = 32U * 1024U;
    if (!server.has_value() ||
        (argc > 2 && !parse_unsigned(argv[2], 1, 1000000, frames)) ||
        (argc > 3 && !parse_unsigned(argv[3], 4, 16U * 1024U * 1024U, frame_bytes))) {
        std::cerr << "invalid argument\n";
        return 2;
    }

    auto client = sp::ws::blocking_client::connect(server.value(), "/object-detection",
                                                   std::chrono::seconds{2});
    if (!client.has_value()) {
        std::cerr << "connect to " << server->to_string()
                  << " failed: " << client.error().message() << '\n';
        return 1;
    }

    const auto image = fake_jpeg(frame_bytes);
    const auto started = std::chrono::steady_clock::now();
    for (unsigned long i = 0; i < frames; ++i) {
        auto sent = client->send_binary(image);
        if (!sent.has_value()) {
            std::cerr << "send failed after " << i
                      << " frames: " << sent.error().message() << '\n';
            return 1;
        }
    }

    // Results stop arriving once the server has worked through what it kept.
    std::uint64_t results = 0;
    std::uint64_t objects = 0;
    while (results < frames) {
        auto received = client->receive();
        if (!received.has_value()) {
            if (received.error().is_errno(EAGAIN) ||
                received.error().is_errno(EWOULDBLOCK)) {
                break;
            }
            std::cerr << "receive failed: " << received.error().message() << '\n';
            return 1;
        }
        ++results;
        const auto decoded = sp::services::decode_objects(received->as_text());
        if (decoded.has_value()) {
            objects += decoded->size();
        }
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::cout << "sent=" << frames << " results=" << results
              << " dropped=" << (frames - results) << " objects=" << objects
              << " elapsed_ms=" << elapsed.count() << '\n';

    const auto closed = client->close();
    if (!closed.has_value()) {
        std::cerr << "close failed: " << closed.error().message() << '\n';
        return 1;
    }
    return 0;
}

#include "streampump/core/errc.hpp"
#include "streampump/services/detection.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <gtest/gtest.h>
#include <utility>
#include <vector>

namespace {

namespace services = streampump::services;
namespace pipeline = streampump::pipeline;

class fixed_detector final : public services::detector {
public:
    explicit fixed_detector(std::vector<services::detected_object> objects)
        : objects_(std::move(objects)) {}

    streampump::result<std::vector<services::detected_object>>
    detect(std::span<const std::byte> /*image*/) override {
        return objects_;
    }

private:
    std::vector<services::detected_object> objects_;
};

std::vector<std::byte> jpeg_bytes() {
    return {std::byte{0xFF}, std::byte{0xD8}, std::byte{0xFF}, std::byte{0xE0},
            std::byte{0x00}};
}

TEST(detection_test, sniffs_jpeg_and_png_magic) {
    EXPECT_EQ(services::sniff_image(jpeg_bytes()), services::image_format::jpeg);

    const std::vector<std::byte> png{std::byte{0x89}, std::byte{'P'}, std::byte{'N'},
                                     std::byte{'G'},  std::byte{0x0D}, std::byte{0x0A},
                                     std::byte{0x1A}, std::byte{0x0A}};
    EXPECT_EQ(services::sniff_image(png), services::image_format::png);

    const std::vector<std::byte> text{std::byte{'h'}, std::byte{'i'}};
    EXPECT_EQ(services::sniff_image(text), services::image_format::unknown);
    EXPECT_EQ(services::sniff_image({}), services::image_format::unknown);
}

TEST(detection_test, encoded_objects_parse_back) {
    const std::vector<services::detected_object> objects{
        {{1.0, 2.0, 30.5, 40.0}, "person", 0.9},
        {{0.0, 0.0, 5.0, 5.0}, "dog", 0.8},
    };
    const auto text = services::encode_objects(objects);
    EXPECT_EQ(services::encode_objects({}), R"({"objects":[]})");

    const auto decoded = services::decode_objects(text);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 2U);
    EXPECT_EQ((*decoded)[0].label, "person");
    EXPECT_DOUBLE_EQ((*decoded)[0].box[2], 30.5);
    EXPECT_EQ((*decoded)[1].label, "dog");
}

TEST(detection_test, malformed_documents_are_bad_messages) {
    for (const auto *text : {"", "[]", R"({"objects":3})",
                             R"({"objects":[{"box":[1,2,3],"label":"x"}]})",
                             R"({"objects":[{"box":[1,2,3,4]}]})"}) {
        const auto decoded = services::decode_objects(text);
        ASSERT_FALSE(decoded.has_value()) << text;
        EXPECT_EQ(decoded.error().value(), EBADMSG) << text;
    }
}

TEST(detection_test, predictor_keeps_objects_above_threshold_only) {
    fixed_detector model{{
        {{0, 0, 1, 1}, "cat", 0.95},
        {{0, 0, 1, 1}, "edge", 0.7},
        {{0, 0, 1, 1}, "faint", 0.2},
    }};
    services::detection_predictor predictor{model};
    EXPECT_DOUBLE_EQ(predictor.threshold(), 0.7);

    const auto result = predictor.predict(pipeline::message::binary(jpeg_bytes()));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->is_text());

    const auto decoded = services::decode_objects(result->as_text());
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 1U);
    EXPECT_EQ(decoded->front().label, "cat");
}

TEST(detection_test, probe_detector_rejects_unknown_images) {
    services::probe_detector model{std::chrono::milliseconds{0}};
    services::detection_predictor predictor{model};

    const auto bad = predictor.predict(pipeline::message::text("not an image"));
    ASSERT_FALSE(bad.has_value());
    EXPECT_TRUE(bad.error().is(streampump::errc::model_failure));

    const auto good = predictor.predict(pipeline::message::binary(jpeg_bytes()));
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ(good->as_text(), R"({"objects":[]})");
    EXPECT_EQ(model.inspected(), 2U);
}

} // namespace

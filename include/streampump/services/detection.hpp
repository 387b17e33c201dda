#pragma once

/**
 * @file
 * @brief Object detection adapter: detector interface, JSON encoding and the
 *        predictor used by the `/object-detection` endpoint.
 */

#include "streampump/core/result.hpp"
#include "streampump/pipeline/predictor.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace streampump::services {

/// @brief One object found in an image.
struct detected_object {
    /// Corners `(x0, y0, x1, y1)` in image pixels.
    std::array<double, 4> box{};
    std::string label{};
    double score{0.0};
};

/**
 * @brief Image model behind the detection predictor.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class detector {
public:
    virtual ~detector() = default;

    /// @return Every candidate object, unfiltered, or `errc::model_failure`.
    [[nodiscard]] virtual result<std::vector<detected_object>>
    detect(std::span<const std::byte> image) = 0;
};

/// @brief Container formats recognised by `sniff_image`.
enum class image_format {
    unknown,
    jpeg,
    png,
};

/// @brief Identify an image by its leading magic bytes.
[[nodiscard]] image_format sniff_image(std::span<const std::byte> data) noexcept;

/**
 * @brief Encode detections as `{"objects":[{"box":[x0,y0,x1,y1],"label":...}]}`.
 *
 * Scores are not part of the wire format.
 */
[[nodiscard]] std::string encode_objects(const std::vector<detected_object>& objects);

/**
 * @brief Parse the output of `encode_objects`.
 * @return `EBADMSG` when the document does not have that shape.
 */
[[nodiscard]] result<std::vector<detected_object>>
decode_objects(std::string_view json_text);

/**
 * @brief Predictor that runs a detector and keeps confident objects only.
 */
class detection_predictor final : public pipeline::predictor {
public:
    /// Objects must score strictly above this to be reported.
    static constexpr double kDefaultThreshold = 0.7;

    explicit detection_predictor(detector& model,
                                 double threshold = kDefaultThreshold) noexcept;

    [[nodiscard]] result<pipeline::message>
    predict(const pipeline::message& frame) override;

    [[nodiscard]] double threshold() const noexcept;

private:
    detector& model_;
    double threshold_{kDefaultThreshold};
};

/**
 * @brief Stand-in model: validates the image container, spends the configured
 *        inference time and finds nothing.
 */
class probe_detector final : public detector {
public:
    explicit probe_detector(std::chrono::milliseconds latency) noexcept;

    /// @return No objects, or `errc::model_failure` for non-JPEG/PNG input.
    [[nodiscard]] result<std::vector<detected_object>>
    detect(std::span<const std::byte> image) override;

    /// @return Number of images inspected so far.
    [[nodiscard]] std::uint64_t inspected() const noexcept;

private:
    std::chrono::milliseconds latency_;
    std::atomic<std::uint64_t> inspected_{0};
};

} // namespace streampump::services

#include "streampump/services/detection.hpp"

#include "streampump/core/errc.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <thread>

namespace {

using json = nlohmann::json;

constexpr std::array<std::uint8_t, 3> kJpegMagic{0xFF, 0xD8, 0xFF};
constexpr std::array<std::uint8_t, 8> kPngMagic{0x89, 0x50, 0x4E, 0x47,
                                                0x0D, 0x0A, 0x1A, 0x0A};

template <std::size_t N>
[[nodiscard]] bool starts_with(std::span<const std::byte> data,
                               const std::array<std::uint8_t, N>& magic) noexcept {
    if (data.size() < N) {
        return false;
    }
    return std::equal(magic.begin(), magic.end(), data.begin(),
                      [](std::uint8_t expected, std::byte actual) {
                          return std::to_integer<std::uint8_t>(actual) == expected;
                      });
}

} // namespace

namespace streampump::services {

image_format sniff_image(std::span<const std::byte> data) noexcept {
    if (starts_with(data, kJpegMagic)) {
        return image_format::jpeg;
    }
    if (starts_with(data, kPngMagic)) {
        return image_format::png;
    }
    return image_format::unknown;
}

std::string encode_objects(const std::vector<detected_object>& objects) {
    json list = json::array();
    for (const auto& object : objects) {
        json entry;
        entry["box"] = {object.box[0], object.box[1], object.box[2], object.box[3]};
        entry["label"] = object.label;
        list.push_back(std::move(entry));
    }

    json document;
    document["objects"] = std::move(list);
    return document.dump();
}

result<std::vector<detected_object>> decode_objects(std::string_view json_text) {
    const auto bad_message = [] {
        return err<std::vector<detected_object>>(make_error_from_errno(EBADMSG));
    };

    const auto document = json::parse(json_text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return bad_message();
    }
    const auto list = document.find("objects");
    if (list == document.end() || !list->is_array()) {
        return bad_message();
    }

    std::vector<detected_object> objects;
    objects.reserve(list->size());
    for (const auto& entry : *list) {
        if (!entry.is_object()) {
            return bad_message();
        }
        const auto box = entry.find("box");
        const auto label = entry.find("label");
        if (box == entry.end() || !box->is_array() || box->size() != 4 ||
            label == entry.end() || !label->is_string()) {
            return bad_message();
        }

        detected_object object{};
        for (std::size_t i = 0; i < 4; ++i) {
            if (!(*box)[i].is_number()) {
                return bad_message();
            }
            object.box[i] = (*box)[i].get<double>();
        }
        object.label = label->get<std::string>();
        objects.push_back(std::move(object));
    }
    return objects;
}

detection_predictor::detection_predictor(detector& model,
                                         double threshold) noexcept
    : model_(model), threshold_(threshold) {}

result<pipeline::message>
detection_predictor::predict(const pipeline::message& frame) {
    auto found = model_.detect(frame.payload);
    if (!found.has_value()) {
        return err<pipeline::message>(found.error());
    }

    std::vector<detected_object> kept;
    for (auto& object : found.value()) {
        if (object.score > threshold_) {
            kept.push_back(std::move(object));
        }
    }
    return pipeline::message::text(encode_objects(kept));
}

double detection_predictor::threshold() const noexcept {
    return threshold_;
}

probe_detector::probe_detector(std::chrono::milliseconds latency) noexcept
    : latency_(latency) {}

result<std::vector<detected_object>>
probe_detector::detect(std::span<const std::byte> image) {
    inspected_.fetch_add(1, std::memory_order_relaxed);
    if (sniff_image(image) == image_format::unknown) {
        return err<std::vector<detected_object>>(errc::model_failure);
    }
    if (latency_ > std::chrono::milliseconds{0}) {
        std::this_thread::sleep_for(latency_);
    }
    return std::vector<detected_object>{};
}

std::uint64_t probe_detector::inspected() const noexcept {
    return inspected_.load(std::memory_order_relaxed);
}

} // namespace streampump::services

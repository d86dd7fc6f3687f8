#include "heat_overlay/io/detection_log.hpp"
#include "heat_overlay/core/errors.hpp"
#include "heat_overlay/core/utils.hpp"

namespace heat_overlay::io {

namespace {

constexpr size_t kMessageFieldCount = 7;

const json* find_array(const json& node, const std::string& key) {
    if (!node.is_object()) return nullptr;
    auto it = node.find(key);
    if (it == node.end() || !it->is_array()) return nullptr;
    return &(*it);
}

const json* find_object(const json& node, const std::string& key) {
    if (!node.is_object()) return nullptr;
    auto it = node.find(key);
    if (it == node.end() || !it->is_object()) return nullptr;
    return &(*it);
}

} // namespace

std::optional<Detection> parse_detection_message(const std::string& message,
                                                 const DetectionLogOptions& opts) {
    const std::vector<std::string> parts = core::split(message, opts.delimiter);
    if (parts.size() != kMessageFieldCount) {
        return std::nullopt;
    }

    const auto x_min = core::parse_double(parts[1]);
    const auto y_min = core::parse_double(parts[2]);
    const auto x_max = core::parse_double(parts[3]);
    const auto y_max = core::parse_double(parts[4]);
    if (!x_min || !y_min || !x_max || !y_max) {
        return std::nullopt;
    }

    if (core::to_lower(parts[5]) != core::to_lower(opts.target_class)) {
        return std::nullopt;
    }

    return Detection{(*x_min + *x_max) / 2.0, (*y_min + *y_max) / 2.0};
}

std::vector<Detection> extract_detections(const json& doc, const DetectionLogOptions& opts) {
    std::vector<Detection> detections;

    const json* outer = find_object(doc, "hits");
    if (!outer) return detections;
    const json* hits = find_array(*outer, "hits");
    if (!hits) return detections;

    for (const auto& hit : *hits) {
        const json* fields = find_object(hit, "fields");
        if (!fields) continue;
        const json* messages = find_array(*fields, opts.message_field);
        if (!messages) continue;

        for (const auto& msg : *messages) {
            if (!msg.is_string()) continue;
            auto det = parse_detection_message(msg.get<std::string>(), opts);
            if (det) {
                detections.push_back(*det);
            }
        }
    }

    return detections;
}

json parse_detection_document(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Invalid detection log JSON: ") + e.what());
    }
}

std::vector<Detection> parse_detection_log(const std::string& text, const DetectionLogOptions& opts) {
    return extract_detections(parse_detection_document(text), opts);
}

json load_detection_document(const fs::path& path, std::uintmax_t max_bytes) {
    const std::vector<uint8_t> bytes = core::read_bytes_limited(path, max_bytes, "JSON");
    return parse_detection_document(std::string(bytes.begin(), bytes.end()));
}

std::vector<Detection> load_detection_log(const fs::path& path, const DetectionLogOptions& opts,
                                          std::uintmax_t max_bytes) {
    return extract_detections(load_detection_document(path, max_bytes), opts);
}

} // namespace heat_overlay::io

#pragma once

#include "heat_overlay/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace heat_overlay::io {

namespace fs = std::filesystem;
using json = nlohmann::json;

struct DetectionLogOptions {
    std::string target_class = "person";
    std::string message_field = "deepstream-msg";
    char delimiter = '|';
};

// Parses one "id|x_min|y_min|x_max|y_max|class|region" message. Returns the
// box centroid for target-class messages, nullopt for anything else.
std::optional<Detection> parse_detection_message(const std::string& message,
                                                 const DetectionLogOptions& opts);

// Walks hits.hits[*].fields[<message_field>][*]. Missing or mistyped nodes
// contribute nothing; malformed messages are skipped.
std::vector<Detection> extract_detections(const json& doc, const DetectionLogOptions& opts);

// Throws ValidationError when text is not valid JSON.
json parse_detection_document(const std::string& text);

std::vector<Detection> parse_detection_log(const std::string& text, const DetectionLogOptions& opts);

// Reads at most max_bytes (InputTooLargeError beyond that).
json load_detection_document(const fs::path& path, std::uintmax_t max_bytes);

std::vector<Detection> load_detection_log(const fs::path& path, const DetectionLogOptions& opts,
                                          std::uintmax_t max_bytes);

} // namespace heat_overlay::io

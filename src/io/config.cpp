#include "heat_overlay/config/configuration.hpp"
#include "heat_overlay/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace heat_overlay::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping");
    }

    try {
        if (node["heatmap"]) {
            auto h = node["heatmap"];
            if (h["sigma"]) cfg.heatmap.sigma = h["sigma"].as<float>();
            if (h["cap"]) cfg.heatmap.cap = h["cap"].as<float>();
        }

        if (node["overlay"]) {
            auto o = node["overlay"];
            if (o["alpha"]) cfg.overlay.alpha = o["alpha"].as<float>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["width"]) cfg.output.width = o["width"].as<int>();
            if (o["height"]) cfg.output.height = o["height"].as<int>();
        }

        if (node["detections"]) {
            auto d = node["detections"];
            if (d["target_class"]) cfg.detections.target_class = d["target_class"].as<std::string>();
            if (d["message_field"]) cfg.detections.message_field = d["message_field"].as<std::string>();
            if (d["delimiter"]) cfg.detections.delimiter = d["delimiter"].as<std::string>();
        }

        if (node["input_limits"]) {
            auto l = node["input_limits"];
            if (l["max_image_bytes"]) cfg.input_limits.max_image_bytes = l["max_image_bytes"].as<std::int64_t>();
            if (l["max_log_bytes"]) cfg.input_limits.max_log_bytes = l["max_log_bytes"].as<std::int64_t>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["heatmap"]["sigma"] = heatmap.sigma;
    node["heatmap"]["cap"] = heatmap.cap;

    node["overlay"]["alpha"] = overlay.alpha;

    node["output"]["width"] = output.width;
    node["output"]["height"] = output.height;

    node["detections"]["target_class"] = detections.target_class;
    node["detections"]["message_field"] = detections.message_field;
    node["detections"]["delimiter"] = detections.delimiter;

    node["input_limits"]["max_image_bytes"] = input_limits.max_image_bytes;
    node["input_limits"]["max_log_bytes"] = input_limits.max_log_bytes;

    return node;
}

void Config::validate() const {
    if (!std::isfinite(heatmap.sigma) || heatmap.sigma < 0.0f) {
        throw ValidationError("heatmap.sigma must be >= 0");
    }
    if (!std::isfinite(heatmap.cap) || heatmap.cap <= 0.0f) {
        throw ValidationError("heatmap.cap must be > 0");
    }

    if (!(overlay.alpha >= 0.0f && overlay.alpha <= 1.0f)) {
        throw ValidationError("overlay.alpha must be in [0,1]");
    }

    if (output.width < 1 || output.width > 16384) {
        throw ValidationError("output.width must be in [1,16384]");
    }
    if (output.height < 1 || output.height > 16384) {
        throw ValidationError("output.height must be in [1,16384]");
    }

    if (detections.target_class.empty()) {
        throw ValidationError("detections.target_class must not be empty");
    }
    if (detections.message_field.empty()) {
        throw ValidationError("detections.message_field must not be empty");
    }
    if (detections.delimiter.size() != 1) {
        throw ValidationError("detections.delimiter must be exactly one character");
    }

    if (input_limits.max_image_bytes <= 0) {
        throw ValidationError("input_limits.max_image_bytes must be > 0");
    }
    if (input_limits.max_log_bytes <= 0) {
        throw ValidationError("input_limits.max_log_bytes must be > 0");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "heatmap": {
      "type": "object",
      "properties": {
        "sigma": {"type": "number", "minimum": 0},
        "cap": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "overlay": {
      "type": "object",
      "properties": {
        "alpha": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "width": {"type": "integer", "minimum": 1, "maximum": 16384},
        "height": {"type": "integer", "minimum": 1, "maximum": 16384}
      }
    },
    "detections": {
      "type": "object",
      "properties": {
        "target_class": {"type": "string", "minLength": 1},
        "message_field": {"type": "string", "minLength": 1},
        "delimiter": {"type": "string", "minLength": 1, "maxLength": 1}
      }
    },
    "input_limits": {
      "type": "object",
      "properties": {
        "max_image_bytes": {"type": "integer", "minimum": 1},
        "max_log_bytes": {"type": "integer", "minimum": 1}
      }
    }
  }
})";
}

} // namespace heat_overlay::config

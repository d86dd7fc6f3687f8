#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace heat_overlay::config {

namespace fs = std::filesystem;

struct HeatmapConfig {
  float sigma = 15.0f; // Gaussian standard deviation in pixels, 0 disables smoothing
  float cap = 100.0f;  // density ceiling applied before min-max normalization
};

struct OverlayConfig {
  float alpha = 0.45f; // opacity of non-zero ramp entries
};

struct OutputConfig {
  int width = 708;
  int height = 480;
};

struct DetectionsConfig {
  std::string target_class = "person";
  std::string message_field = "deepstream-msg";
  std::string delimiter = "|";
};

struct InputLimitsConfig {
  std::int64_t max_image_bytes = 5000000;
  std::int64_t max_log_bytes = 15000000;
};

struct Config {
  HeatmapConfig heatmap;
  OverlayConfig overlay;
  OutputConfig output;
  DetectionsConfig detections;
  InputLimitsConfig input_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace heat_overlay::config

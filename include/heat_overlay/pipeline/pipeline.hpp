#pragma once

#include "heat_overlay/config/configuration.hpp"
#include "heat_overlay/core/types.hpp"
#include "heat_overlay/io/detection_log.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace heat_overlay::pipeline {

enum class OverlayStatus {
    OK,
    NO_DETECTIONS
};

inline std::string overlay_status_to_string(OverlayStatus status) {
    switch (status) {
        case OverlayStatus::OK: return "ok";
        case OverlayStatus::NO_DETECTIONS: return "no_detections";
        default: return "unknown";
    }
}

struct OverlayResult {
    OverlayStatus status = OverlayStatus::NO_DETECTIONS;
    cv::Mat image;             // CV_8UC3, empty unless status == OK
    int detections = 0;
    int detections_in_bounds = 0;
};

io::DetectionLogOptions detection_options(const config::DetectionsConfig& cfg);

// Rasterize -> colorize -> composite. base_bgr must be CV_8UC3 of size
// cfg.output.width x cfg.output.height (PipelineError otherwise). An empty
// detection list is reported as NO_DETECTIONS, not thrown. When log_stream is
// set, JSON-lines phase events are written to it.
OverlayResult render_overlay(const cv::Mat& base_bgr,
                             const std::vector<Detection>& detections,
                             const config::Config& cfg,
                             const std::string& run_id = "",
                             std::ostream* log_stream = nullptr);

// Same, starting from a raw detection log document (adds the EXTRACT phase).
OverlayResult render_overlay_from_log(const cv::Mat& base_bgr,
                                      const nlohmann::json& doc,
                                      const config::Config& cfg,
                                      const std::string& run_id = "",
                                      std::ostream* log_stream = nullptr);

} // namespace heat_overlay::pipeline

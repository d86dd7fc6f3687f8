#include "heat_overlay/pipeline/pipeline.hpp"
#include "heat_overlay/core/errors.hpp"
#include "heat_overlay/core/events.hpp"
#include "heat_overlay/heatmap/color_ramp.hpp"
#include "heat_overlay/heatmap/compositor.hpp"
#include "heat_overlay/heatmap/density.hpp"

#include <opencv2/core.hpp>

namespace heat_overlay::pipeline {

using json = nlohmann::json;

namespace {

// Forwards to EventEmitter only when a log stream was supplied.
class PhaseLog {
public:
    PhaseLog(const std::string& run_id, std::ostream* out) : run_id_(run_id), out_(out) {}

    void start(Phase phase) {
        if (out_) emitter_.phase_start(run_id_, phase, *out_);
    }

    void end(Phase phase, const std::string& status, const json& extra = json::object()) {
        if (out_) emitter_.phase_end(run_id_, phase, status, extra, *out_);
    }

    void warning(const std::string& message) {
        if (out_) emitter_.warning(run_id_, message, *out_);
    }

private:
    std::string run_id_;
    std::ostream* out_;
    core::EventEmitter emitter_;
};

void check_base_image(const cv::Mat& base_bgr, const config::Config& cfg) {
    if (base_bgr.empty()) {
        throw PipelineError("base image is empty");
    }
    if (base_bgr.type() != CV_8UC3) {
        throw PipelineError("base image must be 8-bit 3-channel");
    }
    if (base_bgr.cols != cfg.output.width || base_bgr.rows != cfg.output.height) {
        throw PipelineError("base image is " + std::to_string(base_bgr.cols) + "x" +
                            std::to_string(base_bgr.rows) + ", expected " +
                            std::to_string(cfg.output.width) + "x" +
                            std::to_string(cfg.output.height));
    }
}

} // namespace

io::DetectionLogOptions detection_options(const config::DetectionsConfig& cfg) {
    if (cfg.delimiter.size() != 1) {
        throw ValidationError("detections.delimiter must be exactly one character");
    }
    io::DetectionLogOptions opts;
    opts.target_class = cfg.target_class;
    opts.message_field = cfg.message_field;
    opts.delimiter = cfg.delimiter[0];
    return opts;
}

OverlayResult render_overlay(const cv::Mat& base_bgr,
                             const std::vector<Detection>& detections,
                             const config::Config& cfg,
                             const std::string& run_id,
                             std::ostream* log_stream) {
    cfg.validate();
    check_base_image(base_bgr, cfg);

    PhaseLog log(run_id, log_stream);
    OverlayResult result;
    result.detections = static_cast<int>(detections.size());

    const int width = cfg.output.width;
    const int height = cfg.output.height;

    if (detections.empty()) {
        log.warning("No " + cfg.detections.target_class + " detections found");
        result.status = OverlayStatus::NO_DETECTIONS;
        return result;
    }

    // --- RASTERIZE ---
    log.start(Phase::RASTERIZE);
    result.detections_in_bounds = heatmap::count_in_bounds(detections, width, height);
    if (result.detections_in_bounds < result.detections) {
        log.warning(std::to_string(result.detections - result.detections_in_bounds) +
                    " detections outside " + std::to_string(width) + "x" +
                    std::to_string(height) + " dropped");
    }

    Matrix2Df density = heatmap::accumulate_detections(detections, width, height);
    heatmap::gaussian_smooth_inplace(density, cfg.heatmap.sigma);
    const float peak = density.maxCoeff();
    heatmap::clip_upper_inplace(density, cfg.heatmap.cap);
    const IntensityGrid intensity = heatmap::normalize_to_u8(density);
    const auto nonzero = (intensity.array() > std::uint8_t(0)).count();
    log.end(Phase::RASTERIZE, "ok", {
        {"detections", result.detections},
        {"detections_in_bounds", result.detections_in_bounds},
        {"peak_density", peak},
        {"capped", peak > cfg.heatmap.cap},
        {"nonzero_cells", nonzero}
    });

    // --- COLORIZE ---
    log.start(Phase::COLORIZE);
    const auto ramp = heatmap::shared_color_ramp(cfg.overlay.alpha);
    const cv::Mat layer = heatmap::apply_color_ramp(intensity, *ramp);
    log.end(Phase::COLORIZE, "ok", {{"alpha", cfg.overlay.alpha}, {"ramp_alpha", (*ramp)[1].a}});

    // --- COMPOSITE ---
    log.start(Phase::COMPOSITE);
    result.image = heatmap::composite_over(base_bgr, layer);
    log.end(Phase::COMPOSITE, "ok", {{"width", result.image.cols}, {"height", result.image.rows}});

    result.status = OverlayStatus::OK;
    return result;
}

OverlayResult render_overlay_from_log(const cv::Mat& base_bgr,
                                      const nlohmann::json& doc,
                                      const config::Config& cfg,
                                      const std::string& run_id,
                                      std::ostream* log_stream) {
    PhaseLog log(run_id, log_stream);

    log.start(Phase::EXTRACT);
    const std::vector<Detection> detections =
        io::extract_detections(doc, detection_options(cfg.detections));
    log.end(Phase::EXTRACT, "ok", {
        {"target_class", cfg.detections.target_class},
        {"detections", detections.size()}
    });

    return render_overlay(base_bgr, detections, cfg, run_id, log_stream);
}

} // namespace heat_overlay::pipeline

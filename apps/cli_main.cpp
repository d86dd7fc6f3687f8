#include "heat_overlay/config/configuration.hpp"
#include "heat_overlay/core/events.hpp"
#include "heat_overlay/core/types.hpp"
#include "heat_overlay/core/utils.hpp"
#include "heat_overlay/io/detection_log.hpp"
#include "heat_overlay/io/image_io.hpp"
#include "heat_overlay/pipeline/pipeline.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

namespace config = heat_overlay::config;
namespace core = heat_overlay::core;
namespace io = heat_overlay::io;
namespace pipeline = heat_overlay::pipeline;

struct RenderArgs {
    std::string image_path;
    std::string detections_path;
    std::string output_path;
    std::string config_path;
    float sigma = 0.0f;
    float cap = 0.0f;
    float alpha = 0.0f;
    int width = 0;
    int height = 0;
    std::string target_class;
};

// Command-line values that were given explicitly override the YAML config.
struct Overrides {
    CLI::Option* sigma = nullptr;
    CLI::Option* cap = nullptr;
    CLI::Option* alpha = nullptr;
    CLI::Option* width = nullptr;
    CLI::Option* height = nullptr;
    CLI::Option* target_class = nullptr;
};

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

config::Config load_config(const std::string& path) {
    return path.empty() ? config::Config{} : config::Config::load(path);
}

void apply_overrides(config::Config& cfg, const RenderArgs& a, const Overrides& o) {
    if (o.sigma && o.sigma->count() > 0) cfg.heatmap.sigma = a.sigma;
    if (o.cap && o.cap->count() > 0) cfg.heatmap.cap = a.cap;
    if (o.alpha && o.alpha->count() > 0) cfg.overlay.alpha = a.alpha;
    if (o.width && o.width->count() > 0) cfg.output.width = a.width;
    if (o.height && o.height->count() > 0) cfg.output.height = a.height;
    if (o.target_class && o.target_class->count() > 0) cfg.detections.target_class = a.target_class;
}

// ============================================================================
// render --image <p> --detections <p> --output <p> [--config <p>] [overrides]
// Exit codes: 0 written, 2 no target detections, 1 error.
// ============================================================================
int cmd_render(const RenderArgs& args, const Overrides& overrides) {
    core::EventEmitter emitter;
    const std::string run_id = core::get_run_id();

    try {
        config::Config cfg = load_config(args.config_path);
        apply_overrides(cfg, args, overrides);
        cfg.validate();

        const cv::Mat base = io::load_base_image(
            args.image_path, cfg.output.width, cfg.output.height,
            static_cast<std::uintmax_t>(cfg.input_limits.max_image_bytes));
        const json doc = io::load_detection_document(
            args.detections_path, static_cast<std::uintmax_t>(cfg.input_limits.max_log_bytes));

        emitter.run_start(run_id, {
            {"image", args.image_path},
            {"image_sha256", core::sha256_file(args.image_path)},
            {"detections", args.detections_path},
            {"detections_sha256", core::sha256_file(args.detections_path)},
            {"output", args.output_path},
            {"sigma", cfg.heatmap.sigma},
            {"cap", cfg.heatmap.cap},
            {"alpha", cfg.overlay.alpha},
            {"width", cfg.output.width},
            {"height", cfg.output.height},
            {"target_class", cfg.detections.target_class}
        }, std::cout);

        pipeline::OverlayResult result =
            pipeline::render_overlay_from_log(base, doc, cfg, run_id, &std::cout);

        if (result.status == pipeline::OverlayStatus::NO_DETECTIONS) {
            std::cerr << "No " << cfg.detections.target_class << " detections found.\n";
            emitter.run_end(run_id, false, pipeline::overlay_status_to_string(result.status), std::cout);
            return 2;
        }

        io::write_image(args.output_path, result.image);
        emitter.phase_end(run_id, heat_overlay::Phase::DONE, "ok",
                          {{"output", args.output_path}}, std::cout);
        emitter.run_end(run_id, true, pipeline::overlay_status_to_string(result.status), std::cout);
        std::cerr << "Overlayed image saved to " << args.output_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        emitter.error(run_id, e.what(), std::cout);
        emitter.run_end(run_id, false, "error", std::cout);
        std::cerr << "render: " << e.what() << "\n";
        return 1;
    }
}

// ============================================================================
// extract --detections <p> [--config <p>] [--target-class <c>]
// ============================================================================
int cmd_extract(const std::string& detections_path, const std::string& config_path,
                const std::string& target_class) {
    try {
        config::Config cfg = load_config(config_path);
        if (!target_class.empty()) cfg.detections.target_class = target_class;
        cfg.validate();

        const auto detections = io::load_detection_log(
            detections_path, pipeline::detection_options(cfg.detections),
            static_cast<std::uintmax_t>(cfg.input_limits.max_log_bytes));

        json points = json::array();
        for (const auto& d : detections) {
            points.push_back({d.x, d.y});
        }
        json result;
        result["path"] = detections_path;
        result["target_class"] = cfg.detections.target_class;
        result["count"] = detections.size();
        result["detections"] = points;
        print_json(result);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "extract: " << e.what() << "\n";
        return 1;
    }
}

// ============================================================================
// validate-config --path <p> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    result["path"] = path;

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        if (cfg.heatmap.sigma == 0.0f) {
            result["warnings"].push_back("heatmap.sigma is 0: density is not smoothed");
        }
        if (cfg.overlay.alpha == 0.0f) {
            result["warnings"].push_back("overlay.alpha is 0: output equals the base image");
        }
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"heat_overlay: detection density overlay"};
    app.require_subcommand(1);

    RenderArgs render_args;
    Overrides overrides;
    auto render_cmd = app.add_subcommand("render", "Render a heatmap overlay onto an image");
    render_cmd->add_option("--image", render_args.image_path, "Base image (JPG/PNG)")->required();
    render_cmd->add_option("--detections", render_args.detections_path, "Detection log JSON")->required();
    render_cmd->add_option("--output", render_args.output_path, "Output image path")->required();
    render_cmd->add_option("--config", render_args.config_path, "Path to config.yaml");
    overrides.sigma = render_cmd->add_option("--sigma", render_args.sigma, "Gaussian sigma in pixels");
    overrides.cap = render_cmd->add_option("--cap", render_args.cap, "Density ceiling");
    overrides.alpha = render_cmd->add_option("--alpha", render_args.alpha, "Overlay opacity [0,1]");
    overrides.width = render_cmd->add_option("--width", render_args.width, "Canonical width");
    overrides.height = render_cmd->add_option("--height", render_args.height, "Canonical height");
    overrides.target_class = render_cmd->add_option("--target-class", render_args.target_class,
                                                    "Detection class to keep");

    std::string extract_path, extract_config, extract_class;
    auto extract_cmd = app.add_subcommand("extract", "Print target-class centroids as JSON");
    extract_cmd->add_option("--detections", extract_path, "Detection log JSON")->required();
    extract_cmd->add_option("--config", extract_config, "Path to config.yaml");
    extract_cmd->add_option("--target-class", extract_class, "Detection class to keep");

    std::string validate_path;
    bool strict_exit = false;
    auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
    validate_cmd->add_option("--path", validate_path, "Path to config.yaml")->required();
    validate_cmd->add_flag("--strict-exit-codes", strict_exit, "Exit 1 when invalid");

    auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");

    CLI11_PARSE(app, argc, argv);

    if (render_cmd->parsed()) {
        return cmd_render(render_args, overrides);
    }
    if (extract_cmd->parsed()) {
        return cmd_extract(extract_path, extract_config, extract_class);
    }
    if (validate_cmd->parsed()) {
        return cmd_validate_config(validate_path, strict_exit);
    }
    if (schema_cmd->parsed()) {
        return cmd_get_schema();
    }

    std::cerr << app.help();
    return 1;
}

#include "heat_overlay/heatmap/compositor.hpp"
#include "heat_overlay/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <string>

namespace heat_overlay::heatmap {

namespace {

std::string size_str(const cv::Mat& m) {
    return std::to_string(m.cols) + "x" + std::to_string(m.rows);
}

} // namespace

cv::Mat composite_over(const cv::Mat& base_bgr, const cv::Mat& layer_bgra) {
    if (base_bgr.empty() || layer_bgra.empty()) {
        throw PipelineError("composite_over: empty input");
    }
    if (base_bgr.type() != CV_8UC3) {
        throw PipelineError("composite_over: base image must be CV_8UC3");
    }
    if (layer_bgra.type() != CV_8UC4) {
        throw PipelineError("composite_over: heat layer must be CV_8UC4");
    }
    if (base_bgr.size() != layer_bgra.size()) {
        throw PipelineError("composite_over: base is " + size_str(base_bgr) +
                            " but heat layer is " + size_str(layer_bgra));
    }

    cv::Mat base_bgra;
    cv::cvtColor(base_bgr, base_bgra, cv::COLOR_BGR2BGRA);

    cv::Mat blended(base_bgra.size(), CV_8UC4);
    for (int y = 0; y < blended.rows; ++y) {
        const cv::Vec4b* src = base_bgra.ptr<cv::Vec4b>(y);
        const cv::Vec4b* layer = layer_bgra.ptr<cv::Vec4b>(y);
        cv::Vec4b* dst = blended.ptr<cv::Vec4b>(y);
        for (int x = 0; x < blended.cols; ++x) {
            const double a = layer[x][3] / 255.0;
            for (int c = 0; c < 4; ++c) {
                const double v = layer[x][c] * a + src[x][c] * (1.0 - a);
                dst[x][c] = static_cast<uchar>(v);
            }
        }
    }

    cv::Mat out;
    cv::cvtColor(blended, out, cv::COLOR_BGRA2BGR);
    return out;
}

} // namespace heat_overlay::heatmap

#include "heat_overlay/heatmap/density.hpp"
#include "heat_overlay/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace heat_overlay::heatmap {

namespace {

void check_dimensions(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw ValidationError("grid dimensions must be positive, got " +
                              std::to_string(width) + "x" + std::to_string(height));
    }
}

bool in_bounds(const Detection& d, int width, int height) {
    return d.x >= 0.0 && d.x < static_cast<double>(width) &&
           d.y >= 0.0 && d.y < static_cast<double>(height);
}

} // namespace

Matrix2Df accumulate_detections(const std::vector<Detection>& detections, int width, int height) {
    check_dimensions(width, height);

    Matrix2Df grid = Matrix2Df::Zero(height, width);
    for (const auto& d : detections) {
        if (!in_bounds(d, width, height)) continue;
        const int row = static_cast<int>(std::floor(d.y));
        const int col = static_cast<int>(std::floor(d.x));
        grid(row, col) += 1.0f;
    }
    return grid;
}

int count_in_bounds(const std::vector<Detection>& detections, int width, int height) {
    return static_cast<int>(std::count_if(detections.begin(), detections.end(),
                                          [&](const Detection& d) { return in_bounds(d, width, height); }));
}

void gaussian_smooth_inplace(Matrix2Df& grid, float sigma) {
    if (!std::isfinite(sigma) || sigma < 0.0f) {
        throw ValidationError("sigma must be >= 0");
    }
    if (sigma == 0.0f || grid.size() == 0) return;

    const int radius = static_cast<int>(kGaussianTruncate * sigma + 0.5f);
    const int ksize = 2 * radius + 1;

    cv::Mat view(static_cast<int>(grid.rows()), static_cast<int>(grid.cols()), CV_32F, grid.data());
    cv::Mat blurred;
    cv::GaussianBlur(view, blurred, cv::Size(ksize, ksize), sigma, sigma, cv::BORDER_REFLECT);
    blurred.copyTo(view);
}

void clip_upper_inplace(Matrix2Df& grid, float cap) {
    if (!std::isfinite(cap) || cap <= 0.0f) {
        throw ValidationError("cap must be > 0");
    }
    grid = grid.cwiseMin(cap);
}

IntensityGrid normalize_to_u8(const Matrix2Df& grid) {
    IntensityGrid out = IntensityGrid::Zero(grid.rows(), grid.cols());
    if (grid.size() == 0) return out;

    const float lo = grid.minCoeff();
    const float hi = grid.maxCoeff();
    if (!(hi > lo)) return out;

    // Multiply before dividing: the product of a float range and 255 is exact
    // in double, so the maximum lands on 255 rather than 254.999...
    const double range = static_cast<double>(hi) - static_cast<double>(lo);
    for (Eigen::Index i = 0; i < grid.size(); ++i) {
        double v = (static_cast<double>(grid.data()[i]) - lo) * 255.0 / range;
        v = std::min(255.0, std::max(0.0, v));
        out.data()[i] = static_cast<std::uint8_t>(v);
    }
    return out;
}

IntensityGrid rasterize(const std::vector<Detection>& detections, int width, int height,
                        float sigma, float cap) {
    Matrix2Df grid = accumulate_detections(detections, width, height);
    gaussian_smooth_inplace(grid, sigma);
    clip_upper_inplace(grid, cap);
    return normalize_to_u8(grid);
}

} // namespace heat_overlay::heatmap

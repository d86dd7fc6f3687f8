#pragma once

#include "heat_overlay/core/types.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <cstdint>
#include <memory>

namespace heat_overlay::heatmap {

// Channel order matches OpenCV 4-channel images (BGRA).
struct Bgra {
    std::uint8_t b = 0;
    std::uint8_t g = 0;
    std::uint8_t r = 0;
    std::uint8_t a = 0;
};

inline bool operator==(const Bgra& lhs, const Bgra& rhs) {
    return lhs.b == rhs.b && lhs.g == rhs.g && lhs.r == rhs.r && lhs.a == rhs.a;
}

inline bool operator!=(const Bgra& lhs, const Bgra& rhs) {
    return !(lhs == rhs);
}

using ColorRamp = std::array<Bgra, 256>;

// Ramp breakpoints as indices: floor(255 * {0.10, 0.25, 0.50, 0.70}).
struct RampThresholds {
    int t1;
    int t2;
    int t3;
    int t4;
};

RampThresholds ramp_thresholds();

// Entry 0 is fully transparent. Entries 1..255 interpolate
// blue -> green -> yellow -> orange -> red and carry alpha round(255 * alpha).
ColorRamp build_color_ramp(float alpha = 0.45f);

// Memoized build_color_ramp(alpha). Returned tables are never mutated.
// Alpha is validated before lookup. Entries are never evicted, so the cache
// holds one table per distinct alpha seen by the process (1 KiB each).
std::shared_ptr<const ColorRamp> shared_color_ramp(float alpha);

// Maps every grid cell through the ramp into a CV_8UC4 layer.
cv::Mat apply_color_ramp(const IntensityGrid& grid, const ColorRamp& ramp);

} // namespace heat_overlay::heatmap

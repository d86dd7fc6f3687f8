#include "heat_overlay/heatmap/color_ramp.hpp"
#include "heat_overlay/core/errors.hpp"

#include <cmath>
#include <map>
#include <mutex>

namespace heat_overlay::heatmap {

namespace {

struct Anchor {
    double b;
    double g;
    double r;
};

constexpr Anchor kBlue{255.0, 0.0, 0.0};
constexpr Anchor kGreen{0.0, 255.0, 0.0};
constexpr Anchor kYellow{0.0, 255.0, 255.0};
constexpr Anchor kOrange{0.0, 165.0, 255.0};
constexpr Anchor kRed{0.0, 0.0, 255.0};

Bgra lerp(const Anchor& from, const Anchor& to, double ratio, std::uint8_t alpha) {
    Bgra c;
    c.b = static_cast<std::uint8_t>((1.0 - ratio) * from.b + ratio * to.b);
    c.g = static_cast<std::uint8_t>((1.0 - ratio) * from.g + ratio * to.g);
    c.r = static_cast<std::uint8_t>((1.0 - ratio) * from.r + ratio * to.r);
    c.a = alpha;
    return c;
}

void check_alpha(float alpha) {
    if (!(alpha >= 0.0f && alpha <= 1.0f)) {
        throw ValidationError("alpha must be in [0,1]");
    }
}

} // namespace

RampThresholds ramp_thresholds() {
    return {
        static_cast<int>(255 * 0.10),
        static_cast<int>(255 * 0.25),
        static_cast<int>(255 * 0.50),
        static_cast<int>(255 * 0.70)
    };
}

ColorRamp build_color_ramp(float alpha) {
    check_alpha(alpha);

    const auto a = static_cast<std::uint8_t>(std::lround(255.0 * static_cast<double>(alpha)));
    const RampThresholds t = ramp_thresholds();

    ColorRamp ramp{};
    ramp[0] = Bgra{0, 0, 0, 0};

    for (int i = 1; i < 256; ++i) {
        const double x = static_cast<double>(i);
        if (i <= t.t1) {
            ramp[i] = lerp(kBlue, kGreen, x / t.t1, a);
        } else if (i <= t.t2) {
            ramp[i] = lerp(kGreen, kYellow, (x - t.t1) / (t.t2 - t.t1), a);
        } else if (i <= t.t3) {
            ramp[i] = lerp(kYellow, kOrange, (x - t.t2) / (t.t3 - t.t2), a);
        } else if (i <= t.t4) {
            ramp[i] = lerp(kOrange, kRed, (x - t.t3) / (t.t4 - t.t3), a);
        } else {
            ramp[i] = Bgra{0, 0, 255, a};
        }
    }

    return ramp;
}

std::shared_ptr<const ColorRamp> shared_color_ramp(float alpha) {
    // NaN would compare equivalent to every key.
    check_alpha(alpha);

    static std::mutex mutex;
    static std::map<float, std::shared_ptr<const ColorRamp>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(alpha);
    if (it != cache.end()) {
        return it->second;
    }
    auto ramp = std::make_shared<const ColorRamp>(build_color_ramp(alpha));
    cache.emplace(alpha, ramp);
    return ramp;
}

cv::Mat apply_color_ramp(const IntensityGrid& grid, const ColorRamp& ramp) {
    const int rows = static_cast<int>(grid.rows());
    const int cols = static_cast<int>(grid.cols());
    cv::Mat layer(rows, cols, CV_8UC4);

    for (int y = 0; y < rows; ++y) {
        cv::Vec4b* dst = layer.ptr<cv::Vec4b>(y);
        for (int x = 0; x < cols; ++x) {
            const Bgra& c = ramp[grid(y, x)];
            dst[x] = cv::Vec4b(c.b, c.g, c.r, c.a);
        }
    }
    return layer;
}

} // namespace heat_overlay::heatmap

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>

namespace heat_overlay {

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using IntensityGrid = Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Detection centroid in base-image pixel coordinates
struct Detection {
    double x;
    double y;
};

// Pipeline phase enumeration
enum class Phase {
    EXTRACT = 0,
    RASTERIZE = 1,
    COLORIZE = 2,
    COMPOSITE = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::EXTRACT: return "EXTRACT";
        case Phase::RASTERIZE: return "RASTERIZE";
        case Phase::COLORIZE: return "COLORIZE";
        case Phase::COMPOSITE: return "COMPOSITE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace heat_overlay

#pragma once

#include "heat_overlay/core/types.hpp"

#include <vector>

namespace heat_overlay::heatmap {

// Kernel support in standard deviations: radius = int(kGaussianTruncate * sigma + 0.5).
constexpr float kGaussianTruncate = 4.0f;

// Zero grid (height x width) with +1 at (floor(y), floor(x)) for every
// detection inside [0,width) x [0,height). Others are dropped.
Matrix2Df accumulate_detections(const std::vector<Detection>& detections, int width, int height);

int count_in_bounds(const std::vector<Detection>& detections, int width, int height);

// Gaussian smoothing with reflect boundary handling (d c b a | a b c d),
// kernel truncated at kGaussianTruncate sigmas. sigma == 0 leaves the grid as is.
void gaussian_smooth_inplace(Matrix2Df& grid, float sigma);

void clip_upper_inplace(Matrix2Df& grid, float cap);

// Global min-max rescale to [0,255], truncated. A flat grid maps to all zeros.
IntensityGrid normalize_to_u8(const Matrix2Df& grid);

// accumulate -> smooth -> clip -> normalize.
IntensityGrid rasterize(const std::vector<Detection>& detections, int width, int height,
                        float sigma = 15.0f, float cap = 100.0f);

} // namespace heat_overlay::heatmap

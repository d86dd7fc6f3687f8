#pragma once

#include <opencv2/core.hpp>

namespace heat_overlay::heatmap {

// "Over" blend of a CV_8UC4 layer onto a CV_8UC3 base of the same size:
// out = layer * a + base * (1 - a), a = layer alpha / 255, truncated to 8 bit.
// Returns a new CV_8UC3 image; pixels with a == 0 equal the base exactly.
// Throws PipelineError on size, depth or channel mismatch.
cv::Mat composite_over(const cv::Mat& base_bgr, const cv::Mat& layer_bgra);

} // namespace heat_overlay::heatmap

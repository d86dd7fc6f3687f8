#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace heat_overlay::io {

namespace fs = std::filesystem;

// Decodes JPEG/PNG/... bytes as a 3-channel BGR image.
// Throws ValidationError("... Invalid image file") when OpenCV cannot decode.
cv::Mat decode_image(const std::vector<uint8_t>& bytes);

// Bilinear resize to the canonical width x height; no-op when already sized.
cv::Mat resize_to_canonical(const cv::Mat& image, int width, int height);

// read (bounded by max_bytes) -> decode -> resize.
cv::Mat load_base_image(const fs::path& path, int width, int height, std::uintmax_t max_bytes);

std::vector<uint8_t> encode_png(const cv::Mat& image);

// Format picked from the extension by OpenCV.
void write_image(const fs::path& path, const cv::Mat& image);

} // namespace heat_overlay::io

#include "heat_overlay/io/image_io.hpp"
#include "heat_overlay/core/errors.hpp"
#include "heat_overlay/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace heat_overlay::io {

cv::Mat decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw ValidationError("Invalid image file (empty)");
    }

    cv::Mat buf(1, static_cast<int>(bytes.size()), CV_8U, const_cast<uint8_t*>(bytes.data()));
    cv::Mat img;
    try {
        img = cv::imdecode(buf, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw ValidationError(std::string("Invalid image file: ") + e.what());
    }
    if (img.empty()) {
        throw ValidationError("Invalid image file");
    }
    return img;
}

cv::Mat resize_to_canonical(const cv::Mat& image, int width, int height) {
    if (width <= 0 || height <= 0) {
        throw ValidationError("canonical size must be positive");
    }
    if (image.cols == width && image.rows == height) {
        return image.clone();
    }
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height), 0.0, 0.0, cv::INTER_LINEAR);
    return resized;
}

cv::Mat load_base_image(const fs::path& path, int width, int height, std::uintmax_t max_bytes) {
    const std::vector<uint8_t> bytes = core::read_bytes_limited(path, max_bytes, "Image");
    return resize_to_canonical(decode_image(bytes), width, height);
}

std::vector<uint8_t> encode_png(const cv::Mat& image) {
    std::vector<uint8_t> out;
    if (image.empty() || !cv::imencode(".png", image, out)) {
        throw IOError("PNG encoding failed");
    }
    return out;
}

void write_image(const fs::path& path, const cv::Mat& image) {
    if (image.empty()) {
        throw IOError("Refusing to write empty image: " + path.string());
    }
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

} // namespace heat_overlay::io

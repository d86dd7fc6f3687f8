#include "heat_overlay/io/image_io.hpp"
#include "heat_overlay/core/errors.hpp"
#include "heat_overlay/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace io = heat_overlay::io;

TEST_CASE("decode_rejects_bytes_that_are_not_an_image") {
    const std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
    REQUIRE_THROWS_AS(io::decode_image(garbage), heat_overlay::ValidationError);
    REQUIRE_THROWS_AS(io::decode_image({}), heat_overlay::ValidationError);
}

TEST_CASE("encoded_png_decodes_to_same_pixels") {
    cv::Mat img(12, 20, CV_8UC3, cv::Scalar(10, 20, 30));
    img.at<cv::Vec3b>(5, 7) = cv::Vec3b(200, 100, 50);

    const auto bytes = io::encode_png(img);
    REQUIRE(bytes.size() > 8);
    REQUIRE(bytes[1] == 'P');

    cv::Mat decoded = io::decode_image(bytes);
    REQUIRE(decoded.type() == CV_8UC3);
    REQUIRE(decoded.size() == img.size());
    REQUIRE(decoded.at<cv::Vec3b>(5, 7) == cv::Vec3b(200, 100, 50));
}

TEST_CASE("resize_to_canonical_changes_only_mismatched_images") {
    cv::Mat small(40, 60, CV_8UC3, cv::Scalar(1, 2, 3));
    cv::Mat out = io::resize_to_canonical(small, 708, 480);
    REQUIRE(out.cols == 708);
    REQUIRE(out.rows == 480);
    REQUIRE(out.at<cv::Vec3b>(240, 354) == cv::Vec3b(1, 2, 3));

    cv::Mat sized(480, 708, CV_8UC3, cv::Scalar(4, 5, 6));
    cv::Mat same = io::resize_to_canonical(sized, 708, 480);
    REQUIRE(same.size() == sized.size());
    REQUIRE(same.data != sized.data);
}

TEST_CASE("load_base_image_decodes_and_resizes") {
    const fs::path path = fs::temp_directory_path() / "heat_overlay_test_base.png";
    cv::Mat img(100, 150, CV_8UC3, cv::Scalar(100, 120, 140));
    io::write_image(path, img);

    cv::Mat base = io::load_base_image(path, 708, 480, 5000000);
    REQUIRE(base.type() == CV_8UC3);
    REQUIRE(base.cols == 708);
    REQUIRE(base.rows == 480);
    REQUIRE(base.at<cv::Vec3b>(0, 0) == cv::Vec3b(100, 120, 140));

    try {
        io::load_base_image(path, 708, 480, 16);
        FAIL("expected InputTooLargeError");
    } catch (const heat_overlay::InputTooLargeError& e) {
        REQUIRE(std::string(e.what()).find("too large") != std::string::npos);
    }

    fs::remove(path);
    REQUIRE_THROWS_AS(io::load_base_image(path, 708, 480, 5000000), heat_overlay::IOError);
}

TEST_CASE("load_base_image_rejects_non_image_file") {
    const fs::path path = fs::temp_directory_path() / "heat_overlay_test_not_image.jpg";
    heat_overlay::core::write_bytes(path, {'h', 'e', 'l', 'l', 'o'});
    REQUIRE_THROWS_AS(io::load_base_image(path, 708, 480, 5000000), heat_overlay::ValidationError);
    fs::remove(path);
}

TEST_CASE("write_image_fails_for_unwritable_path") {
    cv::Mat img(4, 4, CV_8UC3, cv::Scalar::all(0));
    const fs::path path = fs::temp_directory_path() / "heat_overlay_missing_dir" / "sub" / "out.png";
    REQUIRE_THROWS_AS(io::write_image(path, img), heat_overlay::IOError);
}

#include "heat_overlay/io/detection_log.hpp"
#include "heat_overlay/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using heat_overlay::io::DetectionLogOptions;
using heat_overlay::io::extract_detections;
using heat_overlay::io::json;
using heat_overlay::io::parse_detection_log;
using heat_overlay::io::parse_detection_message;

namespace {

json log_with_messages(const std::vector<std::string>& messages) {
    json doc;
    json hit;
    hit["fields"]["deepstream-msg"] = messages;
    doc["hits"]["hits"] = json::array({hit});
    return doc;
}

} // namespace

TEST_CASE("person_message_yields_box_centroid") {
    auto det = parse_detection_message("1|100|100|200|200|person|region", DetectionLogOptions{});
    REQUIRE(det.has_value());
    REQUIRE(det->x == Catch::Approx(150.0));
    REQUIRE(det->y == Catch::Approx(150.0));
}

TEST_CASE("other_class_message_is_ignored") {
    auto det = parse_detection_message("1|100|100|200|200|car|region", DetectionLogOptions{});
    REQUIRE_FALSE(det.has_value());
}

TEST_CASE("class_match_is_case_insensitive") {
    auto det = parse_detection_message("7|0|10|4|20|PeRsOn|zone-a", DetectionLogOptions{});
    REQUIRE(det.has_value());
    REQUIRE(det->x == Catch::Approx(2.0));
    REQUIRE(det->y == Catch::Approx(15.0));
}

TEST_CASE("class_label_is_not_trimmed") {
    REQUIRE_FALSE(parse_detection_message("1|0|0|2|2| person|r", DetectionLogOptions{}).has_value());
}

TEST_CASE("wrong_field_count_is_skipped_without_throwing") {
    DetectionLogOptions opts;
    REQUIRE_NOTHROW(parse_detection_message("1|100|100|200|200|person", opts));
    REQUIRE_FALSE(parse_detection_message("1|100|100|200|200|person", opts).has_value());
    REQUIRE_FALSE(parse_detection_message("1|100|100|200|200|person|region|extra", opts).has_value());
    REQUIRE_FALSE(parse_detection_message("", opts).has_value());
}

TEST_CASE("trailing_empty_field_counts_toward_seven") {
    auto det = parse_detection_message("1|0|0|10|10|person|", DetectionLogOptions{});
    REQUIRE(det.has_value());
    REQUIRE(det->x == Catch::Approx(5.0));
}

TEST_CASE("unparseable_coordinate_is_skipped") {
    DetectionLogOptions opts;
    REQUIRE_FALSE(parse_detection_message("1|abc|100|200|200|person|region", opts).has_value());
    REQUIRE_FALSE(parse_detection_message("1|100||200|200|person|region", opts).has_value());
    REQUIRE_FALSE(parse_detection_message("1|100|100|200px|200|person|region", opts).has_value());
}

TEST_CASE("hex_coordinate_is_skipped") {
    DetectionLogOptions opts;
    REQUIRE_FALSE(parse_detection_message("1|0x64|100|200|200|person|r", opts).has_value());
    REQUIRE_FALSE(parse_detection_message("1|100|100|200|0XC8|person|r", opts).has_value());

    auto dets = extract_detections(
        log_with_messages({"1|0x64|100|200|200|person|r", "2|100|100|200|200|person|r"}), opts);
    REQUIRE(dets.size() == 1);
    REQUIRE(dets[0].x == Catch::Approx(150.0));
}

TEST_CASE("underscore_digit_groups_are_accepted") {
    auto det = parse_detection_message("1|1_00|100|2_00|200|person|r", DetectionLogOptions{});
    REQUIRE(det.has_value());
    REQUIRE(det->x == Catch::Approx(150.0));
}

TEST_CASE("coordinates_accept_surrounding_whitespace_and_decimals") {
    auto det = parse_detection_message("1| 10.5 |2e1|11.5|40|person|r", DetectionLogOptions{});
    REQUIRE(det.has_value());
    REQUIRE(det->x == Catch::Approx(11.0));
    REQUIRE(det->y == Catch::Approx(30.0));
}

TEST_CASE("extract_collects_matches_across_hits_in_order") {
    json doc;
    doc["hits"]["hits"] = json::array();
    doc["hits"]["hits"].push_back({{"fields", {{"deepstream-msg", {
        "1|0|0|10|10|person|a",
        "2|0|0|10|10|car|a",
        "broken"
    }}}}});
    doc["hits"]["hits"].push_back({{"fields", {{"deepstream-msg", {"3|20|40|30|60|person|b"}}}}});

    auto dets = extract_detections(doc, DetectionLogOptions{});
    REQUIRE(dets.size() == 2);
    REQUIRE(dets[0].x == Catch::Approx(5.0));
    REQUIRE(dets[1].x == Catch::Approx(25.0));
    REQUIRE(dets[1].y == Catch::Approx(50.0));
}

TEST_CASE("missing_or_mistyped_nodes_contribute_nothing") {
    DetectionLogOptions opts;
    REQUIRE(extract_detections(json::object(), opts).empty());
    REQUIRE(extract_detections(json::array(), opts).empty());
    REQUIRE(extract_detections(json{{"hits", json::object()}}, opts).empty());
    REQUIRE(extract_detections(json{{"hits", {{"hits", "oops"}}}}, opts).empty());

    json doc;
    doc["hits"]["hits"] = json::array();
    doc["hits"]["hits"].push_back(json::object());
    doc["hits"]["hits"].push_back({{"fields", json::object()}});
    doc["hits"]["hits"].push_back({{"fields", {{"deepstream-msg", 42}}}});
    doc["hits"]["hits"].push_back({{"fields", {{"deepstream-msg", {1, nullptr, "1|0|0|2|2|person|r"}}}}});
    auto dets = extract_detections(doc, opts);
    REQUIRE(dets.size() == 1);
}

TEST_CASE("options_select_field_delimiter_and_class") {
    json doc;
    doc["hits"]["hits"] = json::array();
    doc["hits"]["hits"].push_back({{"fields", {{"events", {"1;0;0;4;4;Car;r", "2;0;0;4;4;person;r"}}}}});

    DetectionLogOptions opts;
    opts.message_field = "events";
    opts.delimiter = ';';
    opts.target_class = "car";
    auto dets = extract_detections(doc, opts);
    REQUIRE(dets.size() == 1);
    REQUIRE(dets[0].x == Catch::Approx(2.0));

    REQUIRE(extract_detections(doc, DetectionLogOptions{}).empty());
}

TEST_CASE("no_matches_is_a_valid_empty_result") {
    auto dets = extract_detections(log_with_messages({"1|100|100|200|200|car|region"}), DetectionLogOptions{});
    REQUIRE(dets.empty());
}

TEST_CASE("parse_detection_log_reads_text") {
    const std::string text = R"({
        "hits": {"hits": [{"fields": {"deepstream-msg": ["1|100|100|200|200|person|region"]}}]}
    })";
    auto dets = parse_detection_log(text, DetectionLogOptions{});
    REQUIRE(dets.size() == 1);
    REQUIRE(dets[0].y == Catch::Approx(150.0));
}

TEST_CASE("parse_detection_log_rejects_invalid_json") {
    REQUIRE_THROWS_AS(parse_detection_log("not json", DetectionLogOptions{}), heat_overlay::ValidationError);
}

TEST_CASE("load_detection_log_enforces_byte_limit") {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "heat_overlay_test_detections.json";
    {
        std::ofstream out(path);
        out << log_with_messages({"1|100|100|200|200|person|region"}).dump();
    }

    auto dets = heat_overlay::io::load_detection_log(path, DetectionLogOptions{}, 1000000);
    REQUIRE(dets.size() == 1);

    REQUIRE_THROWS_AS(heat_overlay::io::load_detection_log(path, DetectionLogOptions{}, 8),
                      heat_overlay::InputTooLargeError);
    fs::remove(path);

    REQUIRE_THROWS_AS(heat_overlay::io::load_detection_log(path, DetectionLogOptions{}, 1000000),
                      heat_overlay::IOError);
}

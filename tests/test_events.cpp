#include "heat_overlay/core/events.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using heat_overlay::Phase;
using heat_overlay::core::EventEmitter;
using heat_overlay::core::json;

namespace {

std::vector<json> parse_lines(const std::string& text) {
    std::vector<json> events;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        events.push_back(json::parse(line));
    }
    return events;
}

} // namespace

TEST_CASE("each_event_is_one_newline_terminated_json_object") {
    EventEmitter emitter;
    std::ostringstream out;
    emitter.run_start("r1", {{"image", "a.jpg"}}, out);
    emitter.phase_start("r1", Phase::RASTERIZE, out);
    emitter.warning("r1", "two\nlines", out);
    emitter.run_end("r1", true, "ok", out);

    const std::string text = out.str();
    REQUIRE(!text.empty());
    REQUIRE(text.back() == '\n');

    auto events = parse_lines(text);
    REQUIRE(events.size() == 4);
    for (const auto& e : events) {
        REQUIRE(e.is_object());
        REQUIRE(e["run_id"] == "r1");
        REQUIRE(e["ts"].is_string());
    }
    REQUIRE(events[0]["type"] == "run_start");
    REQUIRE(events[0]["image"] == "a.jpg");
    REQUIRE(events[2]["message"] == "two\nlines");
    REQUIRE(events[3]["success"] == true);
}

TEST_CASE("phase_end_carries_phase_and_statistics") {
    EventEmitter emitter;
    std::ostringstream out;
    emitter.phase_end("r2", Phase::COLORIZE, "ok", {{"alpha", 0.5}}, out);

    auto events = parse_lines(out.str());
    REQUIRE(events.size() == 1);
    REQUIRE(events[0]["type"] == "phase_end");
    REQUIRE(events[0]["phase"] == 2);
    REQUIRE(events[0]["phase_name"] == "COLORIZE");
    REQUIRE(events[0]["status"] == "ok");
    REQUIRE(events[0]["alpha"] == 0.5);
}

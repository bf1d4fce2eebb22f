#include <doctest/doctest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "ball/ball.h"
#include "config/config.h"

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_SUITE("config") {

TEST_CASE("empty document gives defaults") {
    const AppConfig cfg = parse_config(json::object());
    CHECK(cfg.network.group == "224.1.2.3");
    CHECK(cfg.network.port == 7777);
    CHECK(cfg.network.interface_address.empty());
    CHECK(cfg.announce_policy == AnnouncePolicy::Always);
    CHECK(cfg.destination_policy == DestinationPolicy::Random);
    CHECK(cfg.timing.frame == 50ms);
    CHECK(cfg.timing.announce == 1s);
    CHECK(cfg.timing.liveness == 3s);
    CHECK(cfg.timing.status == 20s);
    CHECK(cfg.field.cols == 80);
    CHECK(cfg.field.rows == 24);
    CHECK(cfg.log.level == "info");
    CHECK(cfg.log.file.empty());
}

TEST_CASE("values override defaults") {
    const AppConfig cfg = parse_config(json::parse(R"({
        "network": { "group": "239.1.1.1", "port": 9000, "interface": "10.1.2.3" },
        "node": { "display_name": "alpha", "announce_policy": "when_idle",
                  "destination_policy": "requester" },
        "timing": { "frame_ms": 20, "announce_ms": 500, "liveness_ms": 500, "status_ms": 1000 },
        "field": { "cols": 120, "rows": 40 },
        "log": { "level": "debug", "file": "err.log" }
    })"));
    CHECK(cfg.network.group == "239.1.1.1");
    CHECK(cfg.network.port == 9000);
    CHECK(cfg.network.interface_address == "10.1.2.3");
    CHECK(cfg.display_name == "alpha");
    CHECK(cfg.announce_policy == AnnouncePolicy::WhenIdle);
    CHECK(cfg.destination_policy == DestinationPolicy::Requester);
    CHECK(cfg.timing.frame == 20ms);
    CHECK(cfg.timing.announce == 500ms);
    CHECK(cfg.timing.liveness == 500ms);
    CHECK(cfg.timing.status == 1s);
    CHECK(cfg.field.cols == 120);
    CHECK(cfg.log.level == "debug");
    CHECK(cfg.log.file == "err.log");
}

TEST_CASE("liveness follows the announce interval when not set") {
    const AppConfig cfg = parse_config(json{{"timing", {{"announce_ms", 2000}}}});
    CHECK(cfg.timing.liveness == 6s);
}

TEST_CASE("invalid values are rejected") {
    CHECK_THROWS_AS(parse_config(json{{"node", {{"announce_policy", "sometimes"}}}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"node", {{"destination_policy", "nearest"}}}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"timing", {{"frame_ms", 0}}}}), std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"field", {{"cols", -1}}}}), std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"log", {{"level", "loud"}}}}), std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"network", {{"port", "seven"}}}}), json::exception);
}

TEST_CASE("ports outside 1..65535 are rejected rather than wrapped") {
    CHECK_THROWS_AS(parse_config(json{{"network", {{"port", 70000}}}}), std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"network", {{"port", 0}}}}), std::invalid_argument);
    CHECK(parse_config(json{{"network", {{"port", 65535}}}}).network.port == 65535);
}

TEST_CASE("the field must hold at least one ball") {
    CHECK_THROWS_AS(parse_config(json{{"field", {{"cols", kBallWidth - 1}}}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"field", {{"rows", kBallHeight - 1}}}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(parse_config(json{{"field", {{"cols", kMaxFieldCells + 1}}}}),
                    std::invalid_argument);

    const AppConfig cfg = parse_config(json{{"field", {{"cols", kBallWidth}, {"rows", kBallHeight}}}});
    CHECK(cfg.field.cols == kBallWidth);
    CHECK(cfg.field.rows == kBallHeight);
}

TEST_CASE("load_config reads a file and reports failures") {
    CHECK_FALSE(load_config("does-not-exist.json").has_value());

    const char* path = "ballpass_test_config.json";
    {
        std::ofstream out(path);
        out << R"({ "node": { "display_name": "from-file" } })";
    }
    const auto cfg = load_config(path);
    REQUIRE(cfg);
    CHECK(cfg->display_name == "from-file");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_FALSE(load_config(path).has_value());
    std::remove(path);
}

} // TEST_SUITE

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/// When a node multicasts its WANT.
enum class AnnouncePolicy {
    WhenIdle,   // only while holding no balls
    Always,     // every tick, with the idle flag in the message
};

/// How a node picks the receiver of a ball that reached an edge.
enum class DestinationPolicy {
    Random,     // uniform among live peers
    Requester,  // the last peer that asked, falling back to random
};

struct NetworkConfig {
    std::string group = "224.1.2.3";
    uint16_t port = 7777;
    std::string interface_address;  // empty = let the kernel choose
};

struct TimingConfig {
    std::chrono::milliseconds frame{50};
    std::chrono::milliseconds announce{1000};
    std::chrono::milliseconds liveness{3000};
    std::chrono::milliseconds status{20000};
};

struct FieldConfig {
    int cols = 80;
    int rows = 24;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

struct AppConfig {
    NetworkConfig network;
    std::string display_name;  // empty = host name
    AnnouncePolicy announce_policy = AnnouncePolicy::Always;
    DestinationPolicy destination_policy = DestinationPolicy::Random;
    TimingConfig timing;
    FieldConfig field;
    LogConfig log;
};

/**
 * Build an AppConfig from a parsed JSON document. Missing keys keep their
 * defaults. Throws nlohmann::json::exception on wrongly typed values and
 * std::invalid_argument on unknown policy names or non-positive intervals.
 */
AppConfig parse_config(const nlohmann::json& j);

/// Read and parse a config file. Errors are logged and yield std::nullopt.
std::optional<AppConfig> load_config(const std::string& path);

AnnouncePolicy announce_policy_from_string(const std::string& name);
DestinationPolicy destination_policy_from_string(const std::string& name);

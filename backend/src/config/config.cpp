/**
 * Config — JSON configuration for a ballpass node.
 *
 * The file is optional section by section; anything absent keeps the
 * defaults declared in config.h.
 */

#include "config/config.h"

#include <fstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "ball/ball.h"

using json = nlohmann::json;

namespace {

std::chrono::milliseconds positive_ms(const json& section, const char* key,
                                      std::chrono::milliseconds fallback) {
    const auto ms = section.value(key, static_cast<int64_t>(fallback.count()));
    if (ms <= 0) {
        throw std::invalid_argument(std::string("timing.") + key + " must be positive");
    }
    return std::chrono::milliseconds(ms);
}

} // namespace

AnnouncePolicy announce_policy_from_string(const std::string& name) {
    if (name == "when_idle") return AnnouncePolicy::WhenIdle;
    if (name == "always")    return AnnouncePolicy::Always;
    throw std::invalid_argument("unknown announce_policy: " + name);
}

DestinationPolicy destination_policy_from_string(const std::string& name) {
    if (name == "random")    return DestinationPolicy::Random;
    if (name == "requester") return DestinationPolicy::Requester;
    throw std::invalid_argument("unknown destination_policy: " + name);
}

AppConfig parse_config(const json& j) {
    AppConfig cfg;

    if (j.contains("network")) {
        const auto& n = j.at("network");
        cfg.network.group = n.value("group", cfg.network.group);
        const int port = n.value("port", static_cast<int>(cfg.network.port));
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("network.port must be between 1 and 65535");
        }
        cfg.network.port = static_cast<uint16_t>(port);
        cfg.network.interface_address = n.value("interface", cfg.network.interface_address);
    }

    if (j.contains("node")) {
        const auto& n = j.at("node");
        cfg.display_name = n.value("display_name", cfg.display_name);
        if (n.contains("announce_policy")) {
            cfg.announce_policy =
                announce_policy_from_string(n.at("announce_policy").get<std::string>());
        }
        if (n.contains("destination_policy")) {
            cfg.destination_policy =
                destination_policy_from_string(n.at("destination_policy").get<std::string>());
        }
    }

    if (j.contains("timing")) {
        const auto& t = j.at("timing");
        cfg.timing.frame = positive_ms(t, "frame_ms", cfg.timing.frame);
        cfg.timing.announce = positive_ms(t, "announce_ms", cfg.timing.announce);
        // Follow the announce interval unless the liveness window is given.
        cfg.timing.liveness = positive_ms(t, "liveness_ms", cfg.timing.announce * 3);
        cfg.timing.status = positive_ms(t, "status_ms", cfg.timing.status);
    }

    if (j.contains("field")) {
        const auto& f = j.at("field");
        cfg.field.cols = f.value("cols", cfg.field.cols);
        cfg.field.rows = f.value("rows", cfg.field.rows);
        // A field narrower than one ball has every position past an edge.
        if (cfg.field.cols < kBallWidth || cfg.field.cols > kMaxFieldCells) {
            throw std::invalid_argument("field.cols must be between " +
                                        std::to_string(kBallWidth) + " and " +
                                        std::to_string(kMaxFieldCells));
        }
        if (cfg.field.rows < kBallHeight || cfg.field.rows > kMaxFieldCells) {
            throw std::invalid_argument("field.rows must be between " +
                                        std::to_string(kBallHeight) + " and " +
                                        std::to_string(kMaxFieldCells));
        }
    }

    if (j.contains("log")) {
        const auto& l = j.at("log");
        cfg.log.level = l.value("level", cfg.log.level);
        cfg.log.file = l.value("file", cfg.log.file);
        if (spdlog::level::from_str(cfg.log.level) == spdlog::level::off && cfg.log.level != "off") {
            throw std::invalid_argument("unknown log.level: " + cfg.log.level);
        }
    }

    return cfg;
}

std::optional<AppConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open config file: {}", path);
        return std::nullopt;
    }
    try {
        return parse_config(json::parse(file));
    } catch (const json::exception& e) {
        spdlog::error("Invalid config file {}: {}", path, e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid config file {}: {}", path, e.what());
    }
    return std::nullopt;
}

/**
 * ballpass — Entry Point
 *
 * Loads config, picks a random identity, joins the multicast group and
 * runs the event loop until 'q' or a termination signal.
 *
 * Keys: b = add a ball, r = print members and balls, q = quit. On a
 * terminal they act as soon as they are pressed; piped input is read as is.
 */

#include <random>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/config.h"
#include "logging/logging.h"
#include "network/multicast_transport.h"
#include "node/event_loop.h"
#include "node/node.h"

static std::string resolve_display_name(const AppConfig& config) {
    if (!config.display_name.empty()) return config.display_name;
    asio::error_code ec;
    std::string host = asio::ip::host_name(ec);
    if (ec || host.empty()) {
        spdlog::warn("Cannot read host name ({}), using 'unknown'", ec.message());
        return "unknown";
    }
    return host;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::string config_path = (argc > 1) ? argv[1] : "config.json";
    auto config = load_config(config_path);
    if (!config) return 1;
    if (!setup_logging(config->log)) return 1;

    spdlog::info("Loaded config from {}", config_path);

    std::random_device rd;
    const PeerId id = rd();
    const std::string name = resolve_display_name(*config);
    spdlog::info("Node {} ({}) starting", id, name);

    asio::io_context io;

    MulticastTransport transport(io, config->network);
    if (!transport.open()) return 2;

    Node node(*config, id, name,
              [&transport](const Bytes& payload) { transport.broadcast(payload); },
              rd());

    transport.set_on_datagram(
        [&node](const uint8_t* data, std::size_t size, const std::string& from) {
            node.on_datagram(data, size, from, Clock::now());
        });

    EventLoop loop(io, node, transport, config->timing);
    loop.start();

    spdlog::info("Ready. Press 'b' to add a ball, 'q' to quit.");
    io.run();

    spdlog::info("Node {} stopped holding {} ball(s)", id, node.balls().size());
    return 0;
}

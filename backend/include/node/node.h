#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "ball/ball.h"
#include "config/config.h"
#include "node/announcer.h"
#include "node/handoff_coordinator.h"
#include "node/peer_table.h"
#include "protocol/messages.h"

/// Local keyboard commands.
enum class Command {
    AddBall,
    Redraw,
    Quit,
};

/// Map a key press to a command; other keys are ignored.
std::optional<Command> command_from_key(char key);

/**
 * Represents the local ballpass node.
 *
 * Owns the identity, the peer table and the held balls, and turns every
 * event (datagram, timer tick, command) into state changes. All methods
 * must be called from one thread; the EventLoop guarantees that.
 */
class Node {
public:
    using Broadcast = HandoffCoordinator::Broadcast;

    Node(const AppConfig& config, PeerId id, std::string display_name,
         Broadcast broadcast, uint32_t seed);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Decode and dispatch one datagram received from `from`.
    void on_datagram(const uint8_t* data, std::size_t size,
                     const std::string& from, Clock::time_point now);

    /// Physics step plus edge-triggered handoffs.
    void on_frame();

    /// Expire silent peers, then announce.
    void on_announce_tick(Clock::time_point now);

    /// Log the current membership.
    void on_status_tick() const;

    /// Put a fresh, stationary ball in the middle of the field.
    void add_ball();

    [[nodiscard]] PeerId id() const { return id_; }
    [[nodiscard]] const PeerTable& peers() const { return peers_; }
    [[nodiscard]] const std::vector<Ball>& balls() const { return handoff_.balls(); }

private:
    void handle_want(const WantMessage& want, const std::string& from, Clock::time_point now);

    PeerId id_;
    Field field_;
    Clock::duration liveness_;
    Broadcast broadcast_;
    std::mt19937 rng_;
    PeerTable peers_;
    Announcer announcer_;
    HandoffCoordinator handoff_;
};

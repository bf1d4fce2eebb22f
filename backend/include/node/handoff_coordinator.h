#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <vector>

#include "ball/ball.h"
#include "config/config.h"
#include "node/peer_table.h"
#include "protocol/messages.h"

/**
 * Owns the balls held by this node and decides when and to whom they go.
 *
 * A ball leaves the held set in the same call that hands its SEND to the
 * broadcast callback, so no ball is ever both held and in flight. Lost
 * SENDs are not retried.
 */
class HandoffCoordinator {
public:
    using Broadcast = std::function<void(const Bytes& payload)>;

    HandoffCoordinator(PeerId self, const PeerTable& peers, DestinationPolicy policy,
                       Broadcast broadcast, std::mt19937& rng);

    void add_ball(const Ball& ball);

    /// A live peer announced. If it is waiting for a ball, the first idle
    /// ball starts rolling toward it. Returns true if a ball was kicked.
    bool on_want(PeerId from, bool wants);

    /// Advance every ball one frame and hand off those that hit an edge.
    /// Returns the number of SENDs emitted.
    std::size_t step(const Field& field);

    /// Take a ball addressed to this node. Returns false if it was for someone else.
    bool on_send(const SendMessage& msg, const Field& field);

    /// Stop all horizontal motion; used when the node has become isolated.
    void halt_all();

    [[nodiscard]] const std::vector<Ball>& balls() const { return balls_; }
    [[nodiscard]] std::size_t held() const { return balls_.size(); }
    [[nodiscard]] std::optional<PeerId> requester() const { return requester_; }

private:
    std::optional<PeerId> choose_destination();

    PeerId self_;
    const PeerTable& peers_;
    DestinationPolicy policy_;
    Broadcast broadcast_;
    std::mt19937& rng_;
    std::vector<Ball> balls_;
    std::optional<PeerId> requester_;
};

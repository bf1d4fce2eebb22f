/**
 * HandoffCoordinator — edge-triggered ball handoff.
 *
 * Reaching the left or right edge is what triggers a send; the timers only
 * drive the physics. With nobody to send to, the ball bounces back.
 */

#include "node/handoff_coordinator.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

HandoffCoordinator::HandoffCoordinator(PeerId self, const PeerTable& peers,
                                       DestinationPolicy policy, Broadcast broadcast,
                                       std::mt19937& rng)
    : self_(self), peers_(peers), policy_(policy), broadcast_(std::move(broadcast)), rng_(rng) {}

void HandoffCoordinator::add_ball(const Ball& ball) {
    balls_.push_back(ball);
    spdlog::debug("Ball added, holding {}", balls_.size());
}

bool HandoffCoordinator::on_want(PeerId from, bool wants) {
    if (!wants) return false;
    requester_ = from;

    auto it = std::find_if(balls_.begin(), balls_.end(),
                           [](const Ball& b) { return phase_of(b) == BallPhase::Idle; });
    if (it == balls_.end()) return false;

    // Higher ids pull to the right, lower ids to the left.
    it->sx = from > self_ ? kKickSpeed : -kKickSpeed;
    spdlog::debug("Peer {} wants a ball, kicking {}", from, it->sx > 0 ? "right" : "left");
    return true;
}

std::size_t HandoffCoordinator::step(const Field& field) {
    std::vector<SendMessage> outgoing;

    for (auto it = balls_.begin(); it != balls_.end();) {
        const Edge edge = step_ball(*it, field);
        if (edge == Edge::None) {
            ++it;
            continue;
        }
        // Only a ball already heading somewhere may leave; an idle one is kept in bounds.
        if (phase_of(*it) == BallPhase::Idle) {
            bounce(*it, edge, field);
            ++it;
            continue;
        }

        const auto dest = choose_destination();
        if (!dest) {
            bounce(*it, edge, field);
            spdlog::debug("No peers known, ball bounced");
            ++it;
            continue;
        }

        outgoing.push_back(SendMessage{*dest, *it});
        it = balls_.erase(it);
        requester_.reset();
    }

    for (const auto& msg : outgoing) {
        spdlog::debug("Ball sent to {}, holding {}", msg.dest, balls_.size());
        broadcast_(encode_send(msg));
    }
    return outgoing.size();
}

bool HandoffCoordinator::on_send(const SendMessage& msg, const Field& field) {
    if (msg.dest != self_) {
        spdlog::trace("Ignoring ball addressed to {}", msg.dest);
        return false;
    }

    Ball ball = msg.ball;
    place_arrival(ball, field);
    balls_.push_back(ball);
    spdlog::debug("Ball received, holding {}", balls_.size());
    return true;
}

void HandoffCoordinator::halt_all() {
    for (auto& ball : balls_) {
        ball.sx = 0;
    }
}

std::optional<PeerId> HandoffCoordinator::choose_destination() {
    if (policy_ == DestinationPolicy::Requester && requester_ && peers_.contains(*requester_)) {
        return requester_;
    }
    const auto peer = peers_.pick_random(rng_);
    if (!peer) return std::nullopt;
    return peer->id;
}

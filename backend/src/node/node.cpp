/**
 * Node — Represents the local ballpass node.
 *
 * Owns the identity, the soft-state peer table and the held balls, and
 * coordinates between the network layer and the handoff logic.
 */

#include "node/node.h"

#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

std::optional<Command> command_from_key(char key) {
    switch (key) {
    case 'b': return Command::AddBall;
    case 'r': return Command::Redraw;
    case 'q': return Command::Quit;
    default:  return std::nullopt;
    }
}

Node::Node(const AppConfig& config, PeerId id, std::string display_name,
           Broadcast broadcast, uint32_t seed)
    : id_(id),
      field_{config.field.cols, config.field.rows},
      liveness_(config.timing.liveness),
      broadcast_(std::move(broadcast)),
      rng_(seed),
      announcer_(id, std::move(display_name), config.announce_policy),
      handoff_(id, peers_, config.destination_policy, broadcast_, rng_) {}

void Node::on_datagram(const uint8_t* data, std::size_t size,
                       const std::string& from, Clock::time_point now) {
    const auto msg = decode_message(data, size);
    if (!msg) return;

    if (const auto* want = std::get_if<WantMessage>(&*msg)) {
        handle_want(*want, from, now);
    } else if (const auto* send = std::get_if<SendMessage>(&*msg)) {
        handoff_.on_send(*send, field_);
    }
    // TAKE is reserved and carries nothing yet.
}

void Node::handle_want(const WantMessage& want, const std::string& from, Clock::time_point now) {
    // Multicast loopback delivers our own announcements too.
    if (want.id == id_) return;

    if (peers_.observe(want.id, want.name, from, now)) {
        spdlog::info("Peer {} ({}) joined from {}", want.id, want.name, from);
    }
    handoff_.on_want(want.id, want.wants);
}

void Node::on_frame() {
    handoff_.step(field_);
}

void Node::on_announce_tick(Clock::time_point now) {
    const auto gone = peers_.expire(now, liveness_);
    for (const auto& peer : gone) {
        spdlog::info("Peer {} ({}) expired", peer.id, peer.display_name);
    }
    if (!gone.empty() && peers_.empty()) {
        spdlog::info("No peers left, halting {} ball(s)", handoff_.held());
        handoff_.halt_all();
    }

    if (const auto want = announcer_.on_tick(handoff_.held())) {
        broadcast_(encode_want(*want));
    }
}

void Node::on_status_tick() const {
    spdlog::info("Members: {}", peers_.size());
    for (const auto& peer : peers_.snapshot()) {
        spdlog::info("  {} {}", peer.display_name, peer.address);
    }
}

void Node::add_ball() {
    std::uniform_int_distribution<int> color(kMinColor, kMaxColor);
    handoff_.add_ball(make_ball(field_, color(rng_)));
}

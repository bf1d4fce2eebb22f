#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "protocol/messages.h"

using Clock = std::chrono::steady_clock;

struct PeerRecord {
    PeerId id = 0;
    std::string display_name;
    std::string address;        // "ip:port" the last WANT came from
    Clock::time_point last_heard;
};

/**
 * Soft-state membership view: who has announced recently.
 *
 * Not thread-safe. The Node owns one and only touches it from the
 * event-loop thread.
 */
class PeerTable {
public:
    /// Insert or refresh a peer. Returns true if the peer was not known.
    bool observe(PeerId id, const std::string& display_name,
                 const std::string& address, Clock::time_point now);

    /// Drop peers silent for longer than `threshold`. Returns the dropped records.
    std::vector<PeerRecord> expire(Clock::time_point now, Clock::duration threshold);

    /// Uniform choice among the live peers.
    std::optional<PeerRecord> pick_random(std::mt19937& rng) const;

    std::optional<PeerRecord> find(PeerId id) const;
    bool contains(PeerId id) const { return peers_.count(id) != 0; }

    std::size_t size() const { return peers_.size(); }
    bool empty() const { return peers_.empty(); }

    /// Copy of all records ordered by id.
    std::vector<PeerRecord> snapshot() const;

private:
    std::unordered_map<PeerId, PeerRecord> peers_;
};

#include "node/peer_table.h"

#include <algorithm>
#include <iterator>

bool PeerTable::observe(PeerId id, const std::string& display_name,
                        const std::string& address, Clock::time_point now) {
    auto it = peers_.find(id);
    if (it == peers_.end()) {
        peers_.emplace(id, PeerRecord{id, display_name, address, now});
        return true;
    }
    it->second.display_name = display_name;
    it->second.address = address;
    it->second.last_heard = now;
    return false;
}

std::vector<PeerRecord> PeerTable::expire(Clock::time_point now, Clock::duration threshold) {
    std::vector<PeerRecord> gone;
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (now - it->second.last_heard > threshold) {
            gone.push_back(std::move(it->second));
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    return gone;
}

std::optional<PeerRecord> PeerTable::pick_random(std::mt19937& rng) const {
    if (peers_.empty()) return std::nullopt;
    std::uniform_int_distribution<std::size_t> dist(0, peers_.size() - 1);
    auto it = peers_.begin();
    std::advance(it, dist(rng));
    return it->second;
}

std::optional<PeerRecord> PeerTable::find(PeerId id) const {
    const auto it = peers_.find(id);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

std::vector<PeerRecord> PeerTable::snapshot() const {
    std::vector<PeerRecord> out;
    out.reserve(peers_.size());
    for (const auto& entry : peers_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(),
              [](const PeerRecord& a, const PeerRecord& b) { return a.id < b.id; });
    return out;
}

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "config/config.h"
#include "protocol/messages.h"

/**
 * Decides what this node gossips on each announce tick.
 */
class Announcer {
public:
    Announcer(PeerId self, std::string display_name, AnnouncePolicy policy);

    /// The WANT to broadcast on this tick, or nothing if the policy keeps
    /// a ball holder quiet.
    std::optional<WantMessage> on_tick(std::size_t held_balls) const;

private:
    PeerId self_;
    std::string display_name_;
    AnnouncePolicy policy_;
};

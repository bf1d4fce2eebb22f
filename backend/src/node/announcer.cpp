#include "node/announcer.h"

#include <utility>

Announcer::Announcer(PeerId self, std::string display_name, AnnouncePolicy policy)
    : self_(self), display_name_(std::move(display_name)), policy_(policy) {}

std::optional<WantMessage> Announcer::on_tick(std::size_t held_balls) const {
    const bool idle = held_balls == 0;
    if (policy_ == AnnouncePolicy::WhenIdle && !idle) {
        return std::nullopt;
    }
    return WantMessage{self_, display_name_, idle};
}

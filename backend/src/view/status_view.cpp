#include "view/status_view.h"

namespace {

const char* heading(const Ball& b) {
    if (b.sx > 0) return "right";
    if (b.sx < 0) return "left";
    return "idle";
}

} // namespace

void render_status(std::ostream& out,
                   const std::vector<PeerRecord>& peers,
                   const std::vector<Ball>& balls) {
    out << "Members: " << peers.size() << '\n';
    for (const auto& peer : peers) {
        out << "  " << peer.address << ' ' << peer.display_name << '\n';
    }
    out << "Balls: " << balls.size() << '\n';
    for (const auto& ball : balls) {
        out << "  col " << ball.x / 100 << " row " << ball.y / 100
            << ' ' << heading(ball) << '\n';
    }
    out.flush();
}

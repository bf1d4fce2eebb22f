#pragma once

#include <ostream>
#include <vector>

#include "ball/ball.h"
#include "node/peer_table.h"

/**
 * Plain-text listing of the members and the balls held here. Stands in
 * for a full-screen renderer; reads only snapshots.
 */
void render_status(std::ostream& out,
                   const std::vector<PeerRecord>& peers,
                   const std::vector<Ball>& balls);

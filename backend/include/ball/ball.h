#pragma once

/**
 * The ball: the single-owner resource passed between nodes.
 *
 * Positions and velocities are kept in hundredths of a cell so the
 * arithmetic stays integral. Only the horizontal velocity `sx` matters to
 * the handoff protocol; the rest is there for the physics step.
 */
struct Ball {
    int y = 0;      // height above the floor
    int x = 0;      // left edge
    int sy = 0;     // positive when moving up
    int sx = 0;     // horizontal intent; 0 = stationary
    int color = 1;

    bool operator==(const Ball& o) const {
        return y == o.y && x == o.x && sy == o.sy && sx == o.sx && color == o.color;
    }
    bool operator!=(const Ball& o) const { return !(*this == o); }
};

/// Playing field size in cells.
struct Field {
    int cols = 80;
    int rows = 24;
};

/// Local phase of a held ball. InFlight and Arrived are not stored: a ball
/// in flight is only a SEND datagram, an arrived one becomes Seeking again.
enum class BallPhase { Idle, Seeking };

/// Which side of the field a ball crossed during a step.
enum class Edge { None, Left, Right };

constexpr int kBallWidth = 12;
constexpr int kBallHeight = 4;
constexpr int kGravity = 1200;       // delta-v per second
constexpr int kUpdatesPerSec = 20;
constexpr int kKickSpeed = 10;

// Bounds on values taken from the wire, chosen so `step_ball` cannot overflow.
constexpr int kMaxBallValue = 1000000;
constexpr int kMinColor = 1;
constexpr int kMaxColor = 3;

// Largest field side, in cells, accepted from configuration.
constexpr int kMaxFieldCells = 10000;

inline BallPhase phase_of(const Ball& b) {
    return b.sx == 0 ? BallPhase::Idle : BallPhase::Seeking;
}

/// A stationary ball in the middle of the field.
Ball make_ball(const Field& field, int color);

/**
 * Advance one frame. Vertical motion bounces off floor and ceiling; a
 * horizontal edge crossing is reported, not resolved, so the caller can
 * decide between a handoff and a bounce.
 */
Edge step_ball(Ball& b, const Field& field);

/// Clamp to `edge` and reverse the horizontal intent.
void bounce(Ball& b, Edge edge, const Field& field);

/// Position a received ball on the side opposite the one it left from, so
/// it keeps travelling inward.
void place_arrival(Ball& b, const Field& field);

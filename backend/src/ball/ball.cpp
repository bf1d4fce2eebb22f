#include "ball/ball.h"

Ball make_ball(const Field& field, int color) {
    Ball b;
    b.y = field.rows / 2 * 100;
    b.x = field.cols / 2 * 100;
    b.color = color;
    return b;
}

Edge step_ball(Ball& b, const Field& field) {
    b.y += b.sy / kUpdatesPerSec;
    b.x += b.sx * 100 / kUpdatesPerSec;

    if (b.y < 0) {
        b.y = -b.y;
        b.sy = -b.sy;
    } else if (b.y > field.rows * 100) {
        b.y = field.rows * 100;
        b.sy = -b.sy;
    }
    b.sy -= kGravity / kUpdatesPerSec;

    if (b.x < 0) return Edge::Left;
    if (b.x + kBallWidth * 100 > field.cols * 100) return Edge::Right;
    return Edge::None;
}

void bounce(Ball& b, Edge edge, const Field& field) {
    switch (edge) {
    case Edge::Left:
        b.x = 0;
        break;
    case Edge::Right:
        b.x = (field.cols - kBallWidth) * 100;
        break;
    case Edge::None:
        return;
    }
    b.sx = -b.sx;
}

void place_arrival(Ball& b, const Field& field) {
    b.x = b.sx < 0 ? (field.cols - kBallWidth) * 100 : 0;
}

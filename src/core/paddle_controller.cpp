/**
 * @file paddle_controller.cpp
 * @brief Implementation of clamped paddle movement
 */

#include "core/paddle_controller.h"

#include <algorithm>

#include "core/game_config.h"
#include "core/log.h"

namespace pongsim {

PaddleController::PaddleController(MovableEntity& l, MovableEntity& r, const GameConfig& config)
: left(l), right(r), half_h(config.paddle_y_length / 2.0), step(config.paddle_move_step) {
    if (!(half_h > 0.0) || half_h >= arena::kTop) {
        const GameConfig d;
        log::warn() << "Invalid paddle length " << config.paddle_y_length
                    << ", using default " << d.paddle_y_length;
        half_h = d.paddle_y_length / 2.0;
    }
    if (!(step > 0.0)) {
        const GameConfig d;
        log::warn() << "Invalid paddle move step " << config.paddle_move_step
                    << ", using default " << d.paddle_move_step;
        step = d.paddle_move_step;
    }
}

double PaddleController::clamp_y(double y) const {
    double min_y = arena::kBottom + half_h;
    double max_y = arena::kTop - half_h;
    return std::clamp(y, min_y, max_y);
}

void PaddleController::move(Side side, double delta_y) {
    MovableEntity& p = side == Side::Left ? left : right;
    Vec2 pos = p.position();
    pos.y = clamp_y(pos.y + delta_y);
    p.set_position(pos);
    PONGSIM_DBG << "Paddle " << player_number(side) << " moved to y=" << pos.y;
}

void PaddleController::reset_positions() {
    left.set_position({left.position().x, 0.0});
    right.set_position({right.position().x, 0.0});
    log::debug() << "Paddle positions reset to center";
}

} // namespace pongsim

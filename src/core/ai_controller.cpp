/**
 * @file ai_controller.cpp
 * @brief Implementation of the predictive AI opponent
 */

#include "core/ai_controller.h"

#include <cmath>

#include "core/log.h"
#include "core/movable_entity.h"
#include "core/paddle_controller.h"
#include "core/random_source.h"

namespace pongsim {

AIController::AIController(PaddleController& p, const MovableEntity& b, RandomSource& rnd,
                           Difficulty difficulty, Side side)
: paddles(p), ball(b), random(rnd), level(difficulty),
  settings(&profile_for(difficulty)), own_side(side) {
    log::info() << "AI controller initialized with difficulty: " << difficulty_name(level);
}

void AIController::update(const Vec2& ball_direction) {
    ++frames;
    if (frames % settings->reaction_delay != 0) return;

    if (ball_approaching(ball_direction)) {
        double predicted = predict_intercept(ball.position(), ball_direction, arena::paddle_x(own_side));
        double error = random.uniform(-1.0, 1.0) * settings->prediction_error;
        target = predicted + error;
        // A failed roll skips the whole reaction cycle
        if (random.chance(settings->accuracy)) move_toward(target, settings->speed);
    } else {
        move_toward(0.0, settings->speed * 0.5);
    }
}

void AIController::set_difficulty(Difficulty difficulty) {
    level = difficulty;
    settings = &profile_for(difficulty);
    reset();
    log::info() << "AI difficulty changed to: " << difficulty_name(level);
}

void AIController::reset() {
    frames = 0;
    target = 0.0;
}

double AIController::predict_intercept(const Vec2& ball_pos, const Vec2& ball_direction, double target_x) {
    double time_to_reach = 0.0;
    if (ball_direction.x != 0.0) time_to_reach = (target_x - ball_pos.x) / ball_direction.x;
    return fold_into_arena(ball_pos.y + ball_direction.y * time_to_reach);
}

double AIController::fold_into_arena(double y) {
    if (!std::isfinite(y)) return 0.0;

    // Mirroring at both walls repeats every 4 units; drop whole periods first
    // so a huge extrapolation does not loop for long.
    double shifted = std::fmod(y - arena::kBottom, 4.0);
    if (shifted < 0.0) shifted += 4.0;
    y = arena::kBottom + shifted;

    while (y < arena::kBottom || y > arena::kTop) {
        if (y < arena::kBottom) y = 2.0 * arena::kBottom - y;
        else y = 2.0 * arena::kTop - y;
    }
    return y;
}

bool AIController::ball_approaching(const Vec2& ball_direction) const {
    return own_side == Side::Right ? ball_direction.x > 0.0 : ball_direction.x < 0.0;
}

void AIController::move_toward(double y, double speed) {
    double diff = y - paddles.y(own_side);
    double delta = std::abs(diff) > speed ? std::copysign(speed, diff) : diff;
    paddles.move(own_side, delta);
    PONGSIM_DBG << "AI moved paddle by " << delta << " toward " << y;
}

} // namespace pongsim

/**
 * @file ball_controller.cpp
 * @brief Implementation of ball physics with sub-stepped collision checks
 */

#include "core/ball_controller.h"

#include <algorithm>
#include <cmath>

#include "core/game_config.h"
#include "core/game_events.h"
#include "core/log.h"
#include "core/paddle_controller.h"
#include "core/random_source.h"
#include "core/score_manager.h"

namespace pongsim {

BallController::BallController(MovableEntity& b, const PaddleController& p, ScoreManager& s,
                               const GameEvents& ev, RandomSource& rnd, const GameConfig& config)
: ball(b), paddles(p), scores(s), events(ev), random(rnd),
  r(config.ball_radius),
  band(config.paddle_x_length / 2.0),
  serve_speed(config.ball_initial_speed),
  max_speed(config.ball_max_speed),
  multiplier(config.speed_multiplier),
  interval(config.speed_increase_interval),
  steps(config.sub_steps) {
    const GameConfig d;
    if (steps <= 0) {
        log::warn() << "Invalid sub-step count " << steps << ", stepping whole ticks";
        steps = 1;
    }
    if (interval <= 0) {
        log::warn() << "Invalid speed increase interval " << interval
                    << ", using " << d.speed_increase_interval;
        interval = d.speed_increase_interval;
    }
    if (!(r > 0.0)) {
        log::warn() << "Invalid ball radius " << r << ", using " << d.ball_radius;
        r = d.ball_radius;
    }
    if (!(band > 0.0)) {
        log::warn() << "Invalid paddle thickness " << config.paddle_x_length
                    << ", using " << d.paddle_x_length;
        band = d.paddle_x_length / 2.0;
    }
    if (!(serve_speed > 0.0)) serve_speed = d.ball_initial_speed;
    if (!(max_speed >= serve_speed)) max_speed = std::max(d.ball_max_speed, serve_speed);
    if (!(std::isfinite(multiplier) && multiplier >= 1.0)) {
        log::warn() << "Invalid speed multiplier " << multiplier << ", using " << d.speed_multiplier;
        multiplier = d.speed_multiplier;
    }

    dir = {serve_speed, serve_speed};
}

void BallController::reset() {
    ball.set_position({0.0, 0.0});
    double sign = random.chance(0.5) ? 1.0 : -1.0;
    // |dy| <= |dx| keeps the serve within 45 degrees of horizontal
    double dy = random.uniform(-1.0, 1.0) * serve_speed;
    dir = {sign * serve_speed, dy};
    elapsed = 0;
    rally_count = 0;
    log::info() << "Ball reset to center, direction (" << dir.x << ", " << dir.y << ")";
}

void BallController::tick() {
    ++elapsed;
    if (elapsed % interval == 0) increase_speed();

    const double fraction = 1.0 / steps;
    for (int i = 0; i < steps; ++i) {
        Vec2 p = ball.position() + dir * fraction;
        check_paddle_collision(p);
        check_wall_collision(p);
        ball.set_position(p);
        PONGSIM_DBG << "Ball sub-step " << i << " at (" << p.x << ", " << p.y << ")";
    }
}

void BallController::increase_speed() {
    dir = dir * multiplier;
    cap_speed();
    log::debug() << "Ball speed increased to " << speed();
}

void BallController::cap_speed() {
    double sp = dir.length();
    if (sp > max_speed && sp > 0.0) dir = dir * (max_speed / sp);
}

bool BallController::check_paddle_collision(Vec2& p) {
    const double h = paddles.half_height();

    // Left paddle: leading edge is x - r, band lies just right of the paddle line
    double left_y = paddles.y(Side::Left);
    double left_lead = p.x - r;
    if (dir.x < 0.0
        && left_lead >= arena::kLeftPaddleX && left_lead <= arena::kLeftPaddleX + band
        && p.y >= left_y - h && p.y <= left_y + h) {
        bounce_off_paddle(Side::Left, p, left_y);
        return true;
    }

    // Right paddle: leading edge is x + r, band lies just left of the paddle line
    double right_y = paddles.y(Side::Right);
    double right_lead = p.x + r;
    if (dir.x > 0.0
        && right_lead >= arena::kRightPaddleX - band && right_lead <= arena::kRightPaddleX
        && p.y >= right_y - h && p.y <= right_y + h) {
        bounce_off_paddle(Side::Right, p, right_y);
        return true;
    }
    return false;
}

void BallController::bounce_off_paddle(Side side, Vec2& p, double paddle_y) {
    // Push back out by twice the penetration so the next sub-step starts clear
    if (side == Side::Left) {
        double overlap = (arena::kLeftPaddleX + band) - (p.x - r);
        p.x += 2.0 * overlap;
    } else {
        double overlap = (p.x + r) - (arena::kRightPaddleX - band);
        p.x -= 2.0 * overlap;
    }

    double offset = std::clamp((p.y - paddle_y) / paddles.half_height(), -1.0, 1.0);
    double angle = offset * arena::kMaxBounceAngle;
    double sp = std::min(dir.length(), max_speed);
    double out = side == Side::Left ? 1.0 : -1.0;
    dir = {out * sp * std::cos(angle), sp * std::sin(angle)};

    ++rally_count;
    log::debug() << "Ball hit paddle " << player_number(side) << " (offset " << offset
                 << ", rally " << rally_count << ")";
    events.paddle_hit(side);
}

void BallController::check_wall_collision(Vec2& p) {
    if (p.y - r < arena::kBottom) {
        p.y = arena::kBottom + r;
        dir.y = std::abs(dir.y);
        log::debug() << "Ball hit bottom wall";
        events.wall_hit();
    } else if (p.y + r > arena::kTop) {
        p.y = arena::kTop - r;
        dir.y = -std::abs(dir.y);
        log::debug() << "Ball hit top wall";
        events.wall_hit();
    }

    Side scorer = Side::Left;
    if (p.x - r < arena::kLeft) {
        p.x = arena::kLeft + r;
        dir.x = std::abs(dir.x);
        scorer = Side::Right;
    } else if (p.x + r > arena::kRight) {
        p.x = arena::kRight - r;
        dir.x = -std::abs(dir.x);
        scorer = Side::Left;
    } else {
        return;
    }

    rally_max = std::max(rally_max, rally_count);
    rally_count = 0;
    bool live = !scores.game_over();
    log::info() << "Ball passed paddle " << player_number(opponent(scorer))
                << ", point to player " << player_number(scorer);
    scores.score_point(scorer);
    if (live) events.score(scorer);
}

} // namespace pongsim

/**
 * @file game_config.cpp
 * @brief Validation of configuration values
 */

#include "core/game_config.h"

#include <cmath>

namespace pongsim {

namespace {

template<typename T>
void repair(T& value, const T& fallback, bool valid, const char* key) {
    if (valid) return;
    log::warn() << "Invalid config value " << key << "=" << value
                << ", using default " << fallback;
    value = fallback;
}

bool finite_positive(double v) { return std::isfinite(v) && v > 0.0; }

} // namespace

GameConfig GameConfig::sanitized() const {
    const GameConfig d;
    GameConfig c = *this;

    repair(c.window_width, d.window_width, c.window_width > 0, "window_width");
    repair(c.window_height, d.window_height, c.window_height > 0, "window_height");

    repair(c.ball_radius, d.ball_radius,
           finite_positive(c.ball_radius) && c.ball_radius < 0.5, "ball_radius");
    repair(c.ball_initial_speed, d.ball_initial_speed,
           finite_positive(c.ball_initial_speed), "ball_initial_speed");
    repair(c.ball_max_speed, d.ball_max_speed,
           finite_positive(c.ball_max_speed), "ball_max_speed");
    if (c.ball_max_speed < c.ball_initial_speed) {
        log::warn() << "ball_max_speed " << c.ball_max_speed
                    << " below ball_initial_speed, raising to " << c.ball_initial_speed;
        c.ball_max_speed = c.ball_initial_speed;
    }

    repair(c.paddle_x_length, d.paddle_x_length,
           finite_positive(c.paddle_x_length), "paddle_x_length");
    repair(c.paddle_y_length, d.paddle_y_length,
           finite_positive(c.paddle_y_length) && c.paddle_y_length < 2.0, "paddle_y_length");
    repair(c.paddle_move_step, d.paddle_move_step,
           finite_positive(c.paddle_move_step), "paddle_move_step");

    repair(c.speed_increase_interval, d.speed_increase_interval,
           c.speed_increase_interval > 0, "speed_increase_interval");
    repair(c.speed_multiplier, d.speed_multiplier,
           std::isfinite(c.speed_multiplier) && c.speed_multiplier >= 1.0, "speed_multiplier");
    repair(c.win_score, d.win_score, c.win_score > 0, "win_score");
    // A non-positive sub-step count degrades to one whole-tick step.
    repair(c.sub_steps, 1, c.sub_steps > 0, "sub_steps");
    repair(c.tick_interval_ms, d.tick_interval_ms, c.tick_interval_ms > 0, "tick_interval_ms");

    // Travel per sub-step at full speed must not skip the paddle band.
    double per_step = c.ball_max_speed / c.sub_steps;
    double band = c.paddle_x_length / 2.0;
    if (per_step > band) {
        log::warn() << "ball_max_speed/sub_steps (" << per_step
                    << ") exceeds paddle band width (" << band
                    << "); fast balls may pass through paddles";
    }
    return c;
}

} // namespace pongsim

/**
 * @file game_config.h
 * @brief Tunable values consumed by the simulation core
 *
 * The core only reads these. Loading them from disk is the job of
 * SettingsManager (config/settings.h); the core never touches files.
 */

#pragma once

#include "core/difficulty.h"
#include "core/log.h"

namespace pongsim {

/**
 * @brief Game configuration with built-in defaults
 *
 * Geometry values are in arena units (the arena spans -1..1 on both axes).
 * Speeds are arena units per tick.
 */
struct GameConfig {
    // Window (front end only; the core never reads these)
    int window_width = 800;           ///< Window width in pixels
    int window_height = 600;          ///< Window height in pixels

    // Ball
    double ball_radius = 0.02;        ///< Ball radius
    double ball_initial_speed = 0.01; ///< Horizontal speed component after a reset
    double ball_max_speed = 0.05;     ///< Speed cap applied on bounces and speed-ups

    // Paddles
    double paddle_x_length = 0.02;    ///< Paddle thickness; half of it is the collision band
    double paddle_y_length = 0.4;     ///< Paddle length; half of it is the half-height
    double paddle_move_step = 0.1;    ///< Travel per key press

    // Rules
    int speed_increase_interval = 500; ///< Ticks between speed-ups
    double speed_multiplier = 1.1;     ///< Direction scale applied at each speed-up
    int win_score = 11;                ///< Points needed to win the match
    int sub_steps = 10;                ///< Collision sub-steps per tick

    // Opponent / flow
    bool ai_enabled = false;                        ///< Right paddle AI-controlled at start
    Difficulty default_difficulty = Difficulty::Medium;
    int tick_interval_ms = 10;                      ///< Front end tick period
    bool show_menu = true;                          ///< Start on the mode selection menu

    log::Level log_level = log::Level::Info;

    /**
     * @brief Copy of this config with invalid values replaced by defaults
     *
     * Every replacement is reported with a warning log line. Never fails.
     */
    GameConfig sanitized() const;
};

} // namespace pongsim

/**
 * @file arena.h
 * @brief Arena geometry and the small value types shared by the controllers
 *
 * The arena is a fixed square in simulation units: both axes run from -1.0
 * to +1.0 with the origin at the center and Y increasing upward. Paddles
 * slide along fixed vertical lines at X = -0.9 (left) and X = +0.9 (right).
 */

#pragma once

#include <cmath>

namespace pongsim {

/**
 * @brief 2D point or per-tick velocity in arena units
 */
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2() = default;
    Vec2(double x_, double y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }

    double length() const { return std::sqrt(x * x + y * y); }
};

/**
 * @brief Which paddle / which player
 *
 * Left is player 1, Right is player 2.
 */
enum class Side {
    Left = 0,
    Right = 1
};

inline Side opponent(Side s) { return s == Side::Left ? Side::Right : Side::Left; }

/// Player number shown to users (1 for left, 2 for right)
inline int player_number(Side s) { return s == Side::Left ? 1 : 2; }

namespace arena {

constexpr double kTop = 1.0;
constexpr double kBottom = -1.0;
constexpr double kRight = 1.0;
constexpr double kLeft = -1.0;

constexpr double kLeftPaddleX = -0.9;
constexpr double kRightPaddleX = 0.9;

constexpr double kPi = 3.14159265358979323846;

/// Steepest outgoing angle off a paddle edge (60 degrees)
constexpr double kMaxBounceAngle = kPi / 3.0;

inline double paddle_x(Side s) { return s == Side::Left ? kLeftPaddleX : kRightPaddleX; }

} // namespace arena
} // namespace pongsim

/**
 * @file ball_controller.h
 * @brief Ball kinematics, collision resolution and point scoring
 *
 * The ball advances by its direction vector once per tick. To keep a fast
 * ball from skipping over a paddle, each tick is split into sub_steps equal
 * moves with a full collision check after every one of them.
 */

#pragma once

#include "core/arena.h"
#include "core/movable_entity.h"

namespace pongsim {

struct GameConfig;
struct GameEvents;
class PaddleController;
class ScoreManager;
class RandomSource;

/**
 * @brief Owns the ball's position and direction and steps the physics
 *
 * Collision checks per sub-step, in order:
 * 1. Paddle: the ball's leading edge inside the thin band in front of a
 *    paddle, its Y within the paddle span, and moving toward that paddle.
 *    The ball is pushed back out and leaves at an angle set by where it hit
 *    (center: straight back, edge: up to 60 degrees).
 * 2. Top/bottom wall: clamp inside and flip the vertical component.
 * 3. Left/right wall: clamp inside, flip the horizontal component and
 *    award the point to the opposite side.
 */
class BallController {
public:
    static constexpr int kDefaultSubSteps = 10;

    /**
     * @param ball Ball handle; its position is owned by this controller
     * @param paddles Read for paddle positions and half-height
     * @param scores Receives a point on every left/right wall breach
     * @param events Hooks for paddle hits, wall hits and points
     * @param random Serve direction source
     * @param config Ball geometry, speed-up rules and sub-step count
     */
    BallController(MovableEntity& ball, const PaddleController& paddles, ScoreManager& scores,
                   const GameEvents& events, RandomSource& random, const GameConfig& config);

    /**
     * @brief Serve: center the ball with a fresh random direction
     *
     * Horizontal sign is random; the vertical component is random with
     * magnitude no larger than the horizontal one (at most 45 degrees).
     * The elapsed-tick and rally counters are zeroed.
     */
    void reset();

    /**
     * @brief Advance the ball by one tick
     */
    void tick();

    /**
     * @brief Scale the direction by the configured multiplier (capped)
     */
    void increase_speed();

    const Vec2& direction() const { return dir; }
    void set_direction(const Vec2& d) { dir = d; }
    Vec2 position() const { return ball.position(); }

    /// Current speed in arena units per tick
    double speed() const { return dir.length(); }
    double radius() const { return r; }
    int sub_steps() const { return steps; }

    /// Ticks since the last reset
    long elapsed_ticks() const { return elapsed; }

    /// Paddle returns since the last point
    int rally() const { return rally_count; }

    /// Longest rally seen since construction or clear_longest_rally()
    int longest_rally() const { return rally_max; }
    void clear_longest_rally() { rally_max = 0; }

private:
    bool check_paddle_collision(Vec2& p);
    void check_wall_collision(Vec2& p);
    void bounce_off_paddle(Side side, Vec2& p, double paddle_y);
    void cap_speed();

    MovableEntity& ball;
    const PaddleController& paddles;
    ScoreManager& scores;
    const GameEvents& events;
    RandomSource& random;

    Vec2 dir{0.01, 0.01};     ///< Per-tick velocity
    double r;                 ///< Ball radius
    double band;              ///< Depth of the paddle collision band
    double serve_speed;       ///< Horizontal speed after reset()
    double max_speed;         ///< Speed cap
    double multiplier;        ///< Speed-up factor
    int interval;             ///< Ticks between speed-ups
    int steps;                ///< Sub-steps per tick

    long elapsed = 0;
    int rally_count = 0;
    int rally_max = 0;
};

} // namespace pongsim

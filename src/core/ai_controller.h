/**
 * @file ai_controller.h
 * @brief Computer opponent that predicts where the ball will cross its paddle
 */

#pragma once

#include "core/arena.h"
#include "core/difficulty.h"

namespace pongsim {

class MovableEntity;
class PaddleController;
class RandomSource;

/**
 * @brief Drives one paddle toward the ball's predicted intercept
 *
 * The AI wakes up every reaction_delay ticks. If the ball is heading its
 * way it extrapolates the ball's straight-line path to the paddle's X,
 * folds the result back into the arena to account for wall bounces, adds
 * a random error and, with probability accuracy, steps toward that target.
 * If the ball is heading away it drifts back toward center at half speed.
 *
 * All movement goes through PaddleController::move(), so the AI is subject
 * to the same clamping as a human player.
 */
class AIController {
public:
    /**
     * @param paddles Paddle mover shared with human input
     * @param ball Ball handle, read only
     * @param random Source for accuracy rolls and prediction error
     * @param difficulty Initial profile
     * @param side Paddle the AI controls (right by default)
     */
    AIController(PaddleController& paddles, const MovableEntity& ball, RandomSource& random,
                 Difficulty difficulty = Difficulty::Medium, Side side = Side::Right);

    /**
     * @brief Run one tick of AI logic
     *
     * @param ball_direction The ball's direction after this tick's physics
     */
    void update(const Vec2& ball_direction);

    /**
     * @brief Switch profile; applies from the next update()
     *
     * Drops the frame counter and any pending target so the new profile
     * starts from a clean slate.
     */
    void set_difficulty(Difficulty difficulty);

    /**
     * @brief Predict the ball's Y when it reaches the given X
     *
     * Straight-line extrapolation folded into [-1, 1] by mirroring at the
     * walls. A zero horizontal component yields the ball's current Y.
     */
    static double predict_intercept(const Vec2& ball_pos, const Vec2& ball_direction, double target_x);

    /**
     * @brief Fold a Y coordinate into [-1, 1] by repeated reflection
     */
    static double fold_into_arena(double y);

    Difficulty difficulty() const { return level; }
    const AiProfile& profile() const { return *settings; }
    Side side() const { return own_side; }
    double target_y() const { return target; }
    long frame_counter() const { return frames; }

    /**
     * @brief Forget pending state (frame counter, target)
     */
    void reset();

private:
    bool ball_approaching(const Vec2& ball_direction) const;
    void move_toward(double y, double speed);

    PaddleController& paddles;
    const MovableEntity& ball;
    RandomSource& random;
    Difficulty level;
    const AiProfile* settings;
    Side own_side;

    long frames = 0;
    double target = 0.0;  ///< Last computed target Y
};

} // namespace pongsim

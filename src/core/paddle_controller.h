/**
 * @file paddle_controller.h
 * @brief Clamped paddle movement shared by human input and the AI
 */

#pragma once

#include "core/arena.h"
#include "core/movable_entity.h"

namespace pongsim {

struct GameConfig;

/**
 * @brief Moves the two paddles and keeps them inside the arena
 *
 * This is the only writer of paddle positions. Key handling and the AI
 * both call move(), so every paddle position, whoever caused it, passes
 * through the same clamp to [bottom + half_height, top - half_height].
 */
class PaddleController {
public:
    /**
     * @brief Construct over two paddle handles
     *
     * @param left Left paddle; its X is left as given
     * @param right Right paddle; its X is left as given
     * @param config paddle_y_length and paddle_move_step are read
     */
    PaddleController(MovableEntity& left, MovableEntity& right, const GameConfig& config);

    /**
     * @brief Move a paddle vertically, then clamp to the arena
     *
     * @param side Paddle to move
     * @param delta_y Signed travel (positive is up)
     */
    void move(Side side, double delta_y);

    /**
     * @brief Center both paddles vertically, keeping their X
     */
    void reset_positions();

    /**
     * @brief Clamp a Y coordinate to the range a paddle center may occupy
     */
    double clamp_y(double y) const;

    const MovableEntity& paddle(Side side) const { return side == Side::Left ? left : right; }
    double y(Side side) const { return paddle(side).position().y; }

    double half_height() const { return half_h; }
    double move_step() const { return step; }

private:
    MovableEntity& left;
    MovableEntity& right;
    double half_h;  ///< Half of the paddle length
    double step;    ///< Travel per key press
};

} // namespace pongsim

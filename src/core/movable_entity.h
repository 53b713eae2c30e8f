/**
 * @file movable_entity.h
 * @brief Position handle the controllers are given for ball and paddles
 *
 * Controllers never own the visual objects they move. They receive a
 * MovableEntity reference and read/write its position through it; what
 * sits behind the handle (a plain struct, a renderer's actor, a test
 * double) is up to whoever wired the controllers together.
 */

#pragma once

#include "core/arena.h"

namespace pongsim {

/**
 * @brief Read/write access to an entity's position
 */
class MovableEntity {
public:
    virtual ~MovableEntity() = default;

    virtual Vec2 position() const = 0;
    virtual void set_position(const Vec2& p) = 0;
};

/**
 * @brief MovableEntity backed by a plain coordinate pair
 *
 * GameCore owns one of these for the ball and for each paddle; front ends
 * read the coordinates after every tick to draw the frame.
 */
class Body : public MovableEntity {
public:
    Body() = default;
    explicit Body(const Vec2& p) : pos(p) {}

    Vec2 position() const override { return pos; }
    void set_position(const Vec2& p) override { pos = p; }

private:
    Vec2 pos;
};

} // namespace pongsim

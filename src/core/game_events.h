/**
 * @file game_events.h
 * @brief Optional notification hooks fired by the core
 */

#pragma once

#include <functional>

#include "core/arena.h"

namespace pongsim {

/**
 * @brief Observer callbacks
 *
 * Any hook may be left empty. Hooks are for presentation (sounds, flashes,
 * banners) and must not call back into the controllers that fired them.
 */
struct GameEvents {
    std::function<void(Side)> on_paddle_hit;  ///< Ball returned by the given paddle
    std::function<void(Side)> on_score;       ///< Given side won the point
    std::function<void()> on_wall_hit;        ///< Ball bounced off top or bottom
    std::function<void(Side)> on_game_over;   ///< Given side won the match

    void paddle_hit(Side s) const { if (on_paddle_hit) on_paddle_hit(s); }
    void score(Side s) const { if (on_score) on_score(s); }
    void wall_hit() const { if (on_wall_hit) on_wall_hit(); }
    void game_over(Side s) const { if (on_game_over) on_game_over(s); }
};

} // namespace pongsim

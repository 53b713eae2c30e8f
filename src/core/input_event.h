/**
 * @file input_event.h
 * @brief Messages the front end delivers to GameCore
 *
 * Front ends translate their native key codes into KeyPress actions and
 * their timer into Tick events; GameCore::handle() consumes both.
 */

#pragma once

#include <optional>
#include <variant>

#include "core/arena.h"

namespace pongsim {

/**
 * @brief Abstract player intents
 */
enum class Action {
    PaddleUp,
    PaddleDown,
    TogglePause,
    Reset,
    ToggleAi,
    CycleDifficulty,
    MenuUp,
    MenuDown,
    MenuSelect
};

/**
 * @brief A discrete key intent
 *
 * side is only meaningful for PaddleUp / PaddleDown.
 */
struct KeyPress {
    Action action;
    Side side = Side::Left;
};

/**
 * @brief One fixed simulation advance
 */
struct Tick {};

using InputEvent = std::variant<KeyPress, Tick>;

/**
 * @brief Default keyboard layout
 *
 * Maps a character or one of the Key* codes below to an intent:
 * w/s left paddle, arrows right paddle (and menu selection), space pause,
 * r reset, a AI toggle, d difficulty, enter confirm. Anything else maps to
 * nothing and should be dropped by the caller.
 */
std::optional<KeyPress> map_key(int key, bool menu_visible);

/// Synthetic key codes for keys without a printable character
constexpr int KeyArrowUp = 0x101;
constexpr int KeyArrowDown = 0x102;
constexpr int KeyEnter = 0x103;

} // namespace pongsim

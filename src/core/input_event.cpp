/**
 * @file input_event.cpp
 * @brief Default key bindings
 */

#include "core/input_event.h"

namespace pongsim {

std::optional<KeyPress> map_key(int key, bool menu_visible) {
    if (menu_visible) {
        switch (key) {
            case KeyArrowUp: return KeyPress{Action::MenuUp};
            case KeyArrowDown: return KeyPress{Action::MenuDown};
            case KeyEnter: return KeyPress{Action::MenuSelect};
            default: return std::nullopt;
        }
    }
    switch (key) {
        case 'w': case 'W': return KeyPress{Action::PaddleUp, Side::Left};
        case 's': case 'S': return KeyPress{Action::PaddleDown, Side::Left};
        case KeyArrowUp: return KeyPress{Action::PaddleUp, Side::Right};
        case KeyArrowDown: return KeyPress{Action::PaddleDown, Side::Right};
        case ' ': return KeyPress{Action::TogglePause};
        case 'r': case 'R': return KeyPress{Action::Reset};
        case 'a': case 'A': return KeyPress{Action::ToggleAi};
        case 'd': case 'D': return KeyPress{Action::CycleDifficulty};
        default: return std::nullopt;
    }
}

} // namespace pongsim

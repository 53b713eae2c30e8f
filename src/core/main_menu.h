/**
 * @file main_menu.h
 * @brief Mode selection menu shown before the first serve
 */

#pragma once

#include <functional>

namespace pongsim {

/**
 * @brief Menu entries
 */
enum class MenuOption {
    SinglePlayer = 0,  ///< Human on the left, AI on the right
    TwoPlayer          ///< Both paddles keyboard-controlled
};

/**
 * @brief Menu model: which entry is highlighted and whether it is shown
 *
 * Drawing is left to the front end; it reads visible(), selected() and
 * label() each frame.
 */
class MainMenu {
public:
    static constexpr int kOptionCount = 2;

    explicit MainMenu(bool visible = true) : shown(visible) {}

    void select_next();
    void select_previous();

    /**
     * @brief Accept the highlighted entry: hide and fire on_selection
     */
    void confirm();

    void show() { shown = true; }
    void hide() { shown = false; }
    bool visible() const { return shown; }
    MenuOption selected() const { return current; }

    static const char* label(MenuOption option);

    std::function<void(MenuOption)> on_selection;  ///< Fired by confirm()

private:
    bool shown;
    MenuOption current = MenuOption::SinglePlayer;
};

} // namespace pongsim

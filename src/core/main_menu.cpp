/**
 * @file main_menu.cpp
 * @brief Menu selection logic
 */

#include "core/main_menu.h"

#include "core/log.h"

namespace pongsim {

void MainMenu::select_next() {
    int i = (static_cast<int>(current) + 1) % kOptionCount;
    current = static_cast<MenuOption>(i);
}

void MainMenu::select_previous() {
    int i = (static_cast<int>(current) + kOptionCount - 1) % kOptionCount;
    current = static_cast<MenuOption>(i);
}

void MainMenu::confirm() {
    if (!shown) return;
    shown = false;
    log::info() << "Menu selection: " << label(current);
    if (on_selection) on_selection(current);
}

const char* MainMenu::label(MenuOption option) {
    switch (option) {
        case MenuOption::SinglePlayer: return "Single Player (vs AI)";
        case MenuOption::TwoPlayer: return "Two Player";
    }
    return "";
}

} // namespace pongsim

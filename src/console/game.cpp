/**
 * @file console/game.cpp
 * @brief Implementation of the terminal front end
 */

#include "console/game.h"

#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

#include "console/tick_clock.h"
#include "core/log.h"

namespace pongsim {

namespace {

int to_col(double x, int width) {
    int c = static_cast<int>(std::lround((x + 1.0) * 0.5 * (width - 1)));
    return c < 0 ? 0 : (c >= width ? width - 1 : c);
}

// Y grows upward in the arena, rows grow downward on screen
int to_row(double y, int height) {
    int r = static_cast<int>(std::lround((1.0 - y) * 0.5 * (height - 1)));
    return r < 0 ? 0 : (r >= height ? height - 1 : r);
}

const char* side_name(Side s) {
    return s == Side::Left ? "Left" : "Right";
}

} // namespace

Game::Game(int w, int h, Platform& platform, GameCore& core)
: width(w < 20 ? 20 : w), height(h < 8 ? 8 : h), platform(platform), core(core) {}

// Collapses multi-byte sequences into single key codes
int Game::read_key() {
    int c = platform.getch();
    if (c == 0x1B) { // ESC [ A / ESC [ B
        if (!platform.kbhit()) return c;
        int b1 = platform.getch();
        if (b1 != '[' || !platform.kbhit()) return -1;
        int b2 = platform.getch();
        if (b2 == 'A') return KeyArrowUp;
        if (b2 == 'B') return KeyArrowDown;
        return -1;
    }
    if (c == 0 || c == 0xE0) { // Windows arrow prefix
        if (!platform.kbhit()) return -1;
        int code = platform.getch();
        if (code == 72) return KeyArrowUp;
        if (code == 80) return KeyArrowDown;
        return -1;
    }
    if (c == '\r' || c == '\n') return KeyEnter;
    return c;
}

void Game::process_input() {
    while (platform.kbhit()) {
        int c = read_key();
        if (c < 0) break;
        if (c == 'q' || c == 'Q') { running = false; return; }
        if (auto key = map_key(c, core.menu().visible())) {
            core.handle(*key);
        }
    }
}

std::string Game::frame(const GameSnapshot& s) const {
    std::string out;
    out.reserve((width + 3) * (height + 8));
    out += "\x1b[H"; // cursor home

    if (s.menu_visible) {
        out += "  P O N G\n\n";
        for (int i = 0; i < MainMenu::kOptionCount; ++i) {
            MenuOption opt = static_cast<MenuOption>(i);
            out += (opt == s.menu_selection) ? "  > " : "    ";
            out += MainMenu::label(opt);
            out += '\n';
        }
        out += "\n  Up/Down to choose, Enter to start, Q to quit\n";
        return out;
    }

    const int left_col = to_col(arena::kLeftPaddleX, width);
    const int right_col = to_col(arena::kRightPaddleX, width);
    const int ball_col = to_col(s.ball.x, width);
    const int ball_row = to_row(s.ball.y, height);
    const int lt = to_row(s.left_paddle_y + s.paddle_half_height, height);
    const int lb = to_row(s.left_paddle_y - s.paddle_half_height, height);
    const int rt = to_row(s.right_paddle_y + s.paddle_half_height, height);
    const int rb = to_row(s.right_paddle_y - s.paddle_half_height, height);

    out += '+' + std::string(width, '-') + "+\n";
    for (int y = 0; y < height; ++y) {
        out.push_back('|');
        for (int x = 0; x < width; ++x) {
            char ch = ' ';
            if (x == width / 2 && (y % 2 == 0)) ch = ':';
            if (x == left_col && y >= lt && y <= lb) ch = '#';
            if (x == right_col && y >= rt && y <= rb) ch = '#';
            if (x == ball_col && y == ball_row) ch = 'O';
            out.push_back(ch);
        }
        out += "|\n";
    }
    out += '+' + std::string(width, '-') + "+\n";

    out += "  " + std::to_string(s.scores[0]) + " - " + std::to_string(s.scores[1]);
    out += "   Rally: " + std::to_string(s.rally);
    out += "  Best: " + std::to_string(s.longest_rally);
    out += "   AI: ";
    out += s.ai_enabled ? difficulty_name(s.difficulty) : "off";
    if (s.paused && !s.game_over) out += "   [PAUSED]";
    out += "\x1b[K\n";

    if (s.game_over && s.winner) {
        out += "  *** GAME OVER: ";
        out += side_name(*s.winner);
        out += " player wins! Press R to restart ***\x1b[K\n";
    } else {
        out += "\x1b[K\n";
    }
    out += "  W/S left, Up/Down right, Space pause, R reset, A AI, D difficulty, Q quit\x1b[K\n";
    return out;
}

void Game::render() {
    std::cout << frame(core.snapshot()) << std::flush;
}

int Game::run() {
    platform.set_cursor_visible(false);
    platform.clear_screen();
    TickClock ticks(core.config().tick_interval_ms);
    bool menu_was_visible = core.menu().visible();
    log::info() << "Terminal front end started (" << width << "x" << height << ")";

    while (running) {
        process_input();
        if (!running) break;

        for (int n = ticks.due(); n > 0; --n) core.handle(Tick{});

        bool menu_visible = core.menu().visible();
        if (menu_visible != menu_was_visible) {
            platform.clear_screen();
            menu_was_visible = menu_visible;
        }
        render();
        std::this_thread::sleep_for(ticks.until_next());
    }

    platform.clear_screen();
    platform.set_cursor_visible(true);
    log::info() << "Terminal front end stopped";
    return 0;
}

} // namespace pongsim

/**
 * @file console/game.h
 * @brief Terminal front end for the Pong simulation
 */
#pragma once

#include <string>

#include "core/game_core.h"
#include "platform/platform.h"

namespace pongsim {

/**
 * @brief Drives a GameCore from the keyboard and draws it as text
 *
 * Each frame drains pending key presses, feeds the due number of Tick
 * events to the core, then redraws the whole arena with ANSI cursor
 * positioning. The core holds the state; Game only translates.
 */
class Game {
public:
    /**
     * @param w Arena width in character cells
     * @param h Arena height in character rows
     * @param platform Terminal I/O implementation
     * @param core Match to drive
     */
    Game(int w, int h, Platform& platform, GameCore& core);

    /**
     * @brief Run until the player quits
     *
     * @return Process exit code
     */
    int run();

    /**
     * @brief Build one frame of output without writing it
     */
    std::string frame(const GameSnapshot& s) const;

private:
    void process_input();
    void render();
    int read_key();

    int width, height;
    Platform& platform;
    GameCore& core;
    bool running = true;
};

} // namespace pongsim

/**
 * @file platform_posix.cpp
 * @brief POSIX/Linux implementation of the Platform interface
 *
 * Uses termios to put the terminal in non-canonical, no-echo mode so key
 * presses are seen immediately, and FIONREAD to poll without blocking.
 */

#include "platform/platform.h"
#ifndef _WIN32

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <iostream>

#include "core/log.h"

namespace pongsim {

/**
 * @brief termios-backed Platform
 *
 * Restores the original terminal settings and cursor on destruction.
 */
class PosixPlatform : public Platform {
public:
    PosixPlatform() {
        enable_ansi();
        orig = {};
        if (tcgetattr(STDIN_FILENO, &orig) != 0) {
            log::warn() << "stdin is not a terminal; keyboard input may not work";
            raw = false;
            return;
        }
        term = orig;
        term.c_lflag &= ~(ICANON | ECHO);
        raw = tcsetattr(STDIN_FILENO, TCSANOW, &term) == 0;
    }

    ~PosixPlatform() override {
        if (raw) tcsetattr(STDIN_FILENO, TCSANOW, &orig);
        set_cursor_visible(true);
        std::cout << std::flush;
    }

    bool kbhit() override {
        int bytes = 0;
        if (ioctl(STDIN_FILENO, FIONREAD, &bytes) != 0) return false;
        return bytes > 0;
    }

    int getch() override {
        unsigned char c = 0;
        if (read(STDIN_FILENO, &c, 1) <= 0) return -1;
        return static_cast<int>(c);
    }

    void clear_screen() override {
        std::cout << "\x1b[2J\x1b[H";
    }

    void set_cursor_visible(bool visible) override {
        if (visible) std::cout << "\x1b[?25h";
        else std::cout << "\x1b[?25l";
    }

    void enable_ansi() override {
        // POSIX terminals support ANSI sequences by default
    }

private:
    struct termios orig;  ///< Settings to restore on exit
    struct termios term;  ///< Raw-mode settings
    bool raw = false;     ///< true once raw mode was applied
};

std::unique_ptr<Platform> createPlatform() {
    return std::make_unique<PosixPlatform>();
}

} // namespace pongsim

#endif

/**
 * @file platform.h
 * @brief Platform abstraction layer for terminal I/O
 *
 * This file defines the Platform interface that abstracts keyboard polling
 * and terminal control across operating systems (Windows, POSIX/Linux).
 */

#pragma once

#include <memory>

namespace pongsim {

/**
 * @brief Abstract interface for platform-specific terminal operations
 *
 * The Platform interface provides a common API for terminal operations that
 * differ between Windows and POSIX systems, so the front end can stay
 * platform-independent.
 */
struct Platform {
    virtual ~Platform() = default;

    /**
     * @brief Check if a key has been pressed
     *
     * Non-blocking. Returns true if a byte is waiting to be read with getch().
     */
    virtual bool kbhit() = 0;

    /**
     * @brief Read one byte of keyboard input
     *
     * Use together with kbhit() for non-blocking input. Multi-byte keys
     * (arrows) arrive as several bytes.
     *
     * @return Byte value 0..255, or -1 on error
     */
    virtual int getch() = 0;

    /**
     * @brief Clear the terminal and move the cursor home
     */
    virtual void clear_screen() = 0;

    /**
     * @brief Show or hide the text cursor
     */
    virtual void set_cursor_visible(bool visible) = 0;

    /**
     * @brief Enable ANSI escape sequence support
     *
     * On Windows this turns on virtual terminal processing; elsewhere it
     * does nothing.
     */
    virtual void enable_ansi() = 0;
};

/**
 * @brief Create the implementation for the current operating system
 *
 * termios-based on POSIX systems, Win32 console based on Windows.
 */
std::unique_ptr<Platform> createPlatform();

} // namespace pongsim

/**
 * @file tick_clock.h
 * @brief Fixed-interval tick scheduling for the terminal loop
 *
 * This file provides the TickClock class used to turn wall-clock time into a
 * whole number of simulation ticks, so the simulation speed does not depend
 * on how fast frames are drawn.
 */

#pragma once

#include <chrono>

namespace pongsim {

/**
 * @brief Accumulates elapsed time and hands it out in fixed ticks
 *
 * TickClock measures time with std::chrono::steady_clock. Each call to
 * due() adds the time since the previous call to an accumulator and
 * returns how many whole intervals it now contains. When the loop falls far
 * behind (debugger, suspended terminal) the backlog is dropped beyond
 * max_catch_up ticks instead of fast-forwarding the match.
 */
class TickClock {
public:
    using clock = std::chrono::steady_clock;  ///< Monotonic clock type

    /**
     * @brief Construct a clock and start timing
     *
     * @param interval_ms Tick length in milliseconds; values below 1 are treated as 1
     * @param max_catch_up Largest number of ticks due() returns at once
     */
    explicit TickClock(int interval_ms, int max_catch_up = 5);

    /**
     * @brief Number of ticks that became due since the last call
     */
    int due();

    /**
     * @brief Same as due() but with an explicit current time
     */
    int due(clock::time_point now);

    /**
     * @brief Time left until the next tick is due
     */
    clock::duration until_next() const;

    /**
     * @brief Drop any accumulated time and restart from now
     */
    void restart();

private:
    clock::duration interval;   ///< Length of one tick
    int max_ticks;              ///< Catch-up cap per call
    clock::time_point last;     ///< Time point of the last due() call
    clock::duration pending{};  ///< Accumulated, not yet ticked time
};

} // namespace pongsim

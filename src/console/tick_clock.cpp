/**
 * @file tick_clock.cpp
 * @brief Implementation of TickClock
 */

#include "console/tick_clock.h"

namespace pongsim {

TickClock::TickClock(int interval_ms, int max_catch_up)
    : interval(std::chrono::milliseconds(interval_ms < 1 ? 1 : interval_ms)),
      max_ticks(max_catch_up < 1 ? 1 : max_catch_up),
      last(clock::now()) {}

int TickClock::due() {
    return due(clock::now());
}

int TickClock::due(clock::time_point now) {
    if (now > last) pending += now - last;
    last = now;

    int ticks = 0;
    while (pending >= interval && ticks < max_ticks) {
        pending -= interval;
        ++ticks;
    }
    // Too far behind: forget the rest of the backlog
    if (pending >= interval) pending = clock::duration::zero();
    return ticks;
}

TickClock::clock::duration TickClock::until_next() const {
    return pending >= interval ? clock::duration::zero() : interval - pending;
}

void TickClock::restart() {
    last = clock::now();
    pending = clock::duration::zero();
}

} // namespace pongsim

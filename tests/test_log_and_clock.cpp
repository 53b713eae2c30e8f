/**
 * @file test_log_and_clock.cpp
 * @brief Tests for the logging facade and the terminal tick clock.
 *
 * Tests cover:
 *  1.  Lines carry a bracketed level tag and go to the configured sink
 *  2.  Lines below the threshold are dropped
 *  3.  Level names parse case-insensitively
 *  4.  TickClock hands out whole ticks and keeps the remainder
 *  5.  TickClock caps catch-up and drops the backlog
 *  6.  TickClock reports the time until the next tick
 */

#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>

#include "console/tick_clock.h"
#include "core/log.h"

using namespace pongsim;
using std::chrono::milliseconds;

// =============================================================================
// Test harness
// =============================================================================

static int sTestsPassed = 0;
static int sTestsFailed = 0;

#define TEST_ASSERT(cond, msg)                                              \
    do                                                                      \
    {                                                                       \
        if (!(cond))                                                        \
        {                                                                   \
            std::printf("  FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__);  \
            ++sTestsFailed;                                                 \
            return;                                                         \
        }                                                                   \
    } while (0)

#define RUN_TEST(fn)                                    \
    do                                                  \
    {                                                   \
        std::printf("  Running: %s\n", #fn);            \
        const int failedBefore = sTestsFailed;          \
        fn();                                           \
        if (sTestsFailed == failedBefore)               \
            ++sTestsPassed;                             \
    } while (0)

// =============================================================================
// Tests
// =============================================================================

static void test_log_tags_and_sink()
{
    std::ostringstream out;
    log::set_sink(&out);
    log::set_level(log::Level::Debug);

    log::info() << "score " << 3;
    log::warn() << "odd value";
    log::debug() << "trace";

    const std::string text = out.str();
    TEST_ASSERT(text.find("[INFO] score 3\n") != std::string::npos, "info line written");
    TEST_ASSERT(text.find("[WARN] odd value\n") != std::string::npos, "warn line written");
    TEST_ASSERT(text.find("[DEBUG] trace\n") != std::string::npos, "debug line written");

    log::set_sink(nullptr);
    log::set_level(log::Level::Off);
}

static void test_log_threshold()
{
    std::ostringstream out;
    log::set_sink(&out);
    log::set_level(log::Level::Warn);

    log::debug() << "hidden debug";
    log::info() << "hidden info";
    log::error() << "shown";

    const std::string text = out.str();
    TEST_ASSERT(text.find("hidden") == std::string::npos, "lines below threshold dropped");
    TEST_ASSERT(text == "[ERROR] shown\n", "error line kept");
    TEST_ASSERT(log::level() == log::Level::Warn, "threshold reported");

    log::set_level(log::Level::Off);
    log::error() << "silenced";
    TEST_ASSERT(out.str() == "[ERROR] shown\n", "off silences everything");

    log::set_sink(nullptr);
}

static void test_parse_level()
{
    log::Level lvl = log::Level::Info;
    TEST_ASSERT(log::parse_level("WARNING", lvl) && lvl == log::Level::Warn, "warning alias");
    TEST_ASSERT(log::parse_level("Off", lvl) && lvl == log::Level::Off, "off");
    TEST_ASSERT(!log::parse_level("loud", lvl), "unknown rejected");
    TEST_ASSERT(lvl == log::Level::Off, "unknown leaves value untouched");
    TEST_ASSERT(std::string(log::level_name(log::Level::Error)) == "error", "level name");
}

static void test_clock_whole_ticks()
{
    TickClock clock(10);
    const TickClock::clock::time_point t0 = TickClock::clock::now();
    clock.restart();

    // restart() may have read a slightly later time than t0
    TickClock::clock::time_point base = t0 + milliseconds(1000);
    TEST_ASSERT(clock.due(base) <= 5, "first call capped");

    TEST_ASSERT(clock.due(base + milliseconds(25)) == 2, "25 ms is two ticks");
    TEST_ASSERT(clock.due(base + milliseconds(30)) == 1, "remainder carried over");
    TEST_ASSERT(clock.due(base + milliseconds(30)) == 0, "no time, no ticks");
}

static void test_clock_catch_up_cap()
{
    TickClock clock(10, 3);
    TickClock::clock::time_point base = TickClock::clock::now() + milliseconds(5000);
    clock.due(base);

    TEST_ASSERT(clock.due(base + milliseconds(1000)) == 3, "catch-up capped");
    TEST_ASSERT(clock.due(base + milliseconds(1005)) == 0, "backlog dropped");
}

static void test_clock_until_next()
{
    TickClock clock(20);
    TickClock::clock::time_point base = TickClock::clock::now() + milliseconds(5000);
    clock.due(base);

    clock.due(base + milliseconds(5));
    TEST_ASSERT(clock.until_next() == milliseconds(15), "15 ms left");

    TickClock zero(0);
    zero.due(base);
    zero.due(base + milliseconds(1));
    TEST_ASSERT(zero.until_next() == milliseconds(1), "interval below one treated as one");
}

// =============================================================================
// main
// =============================================================================

int main()
{
    std::printf("=== test_log_and_clock ===\n");
    log::set_level(log::Level::Off);

    RUN_TEST(test_log_tags_and_sink);
    RUN_TEST(test_log_threshold);
    RUN_TEST(test_parse_level);
    RUN_TEST(test_clock_whole_ticks);
    RUN_TEST(test_clock_catch_up_cap);
    RUN_TEST(test_clock_until_next);

    std::printf("\n%d/%d tests passed\n", sTestsPassed, sTestsPassed + sTestsFailed);
    return sTestsFailed == 0 ? 0 : 1;
}

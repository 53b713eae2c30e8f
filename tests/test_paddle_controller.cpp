/**
 * @file test_paddle_controller.cpp
 * @brief Tests for PaddleController clamping and reset.
 *
 * Tests cover:
 *  1.  move() applies the delta to the requested side only
 *  2.  move() clamps at the top and bottom walls
 *  3.  Many random moves keep both paddles in range
 *  4.  reset_positions() centers Y and keeps X
 *  5.  Invalid length and step fall back to defaults
 *  6.  Configured length changes the clamp range
 */

#include <cmath>
#include <cstdio>

#include "core/arena.h"
#include "core/game_config.h"
#include "core/log.h"
#include "core/movable_entity.h"
#include "core/paddle_controller.h"
#include "core/random_source.h"

using namespace pongsim;

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

static bool near(double a, double b, double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

// =============================================================================
// Tests
// =============================================================================

static void test_move_single_side()
{
    Body left(Vec2(arena::kLeftPaddleX, 0.0));
    Body right(Vec2(arena::kRightPaddleX, 0.0));
    PaddleController paddles(left, right, GameConfig{});

    paddles.move(Side::Left, paddles.move_step());
    TEST_ASSERT(near(paddles.y(Side::Left), 0.1), "left moved up one step");
    TEST_ASSERT(paddles.y(Side::Right) == 0.0, "right untouched");

    paddles.move(Side::Right, -0.25);
    TEST_ASSERT(near(paddles.y(Side::Right), -0.25), "right moved down");
    TEST_ASSERT(near(paddles.y(Side::Left), 0.1), "left untouched");
}

static void test_move_clamps_at_walls()
{
    Body left(Vec2(arena::kLeftPaddleX, 0.0));
    Body right(Vec2(arena::kRightPaddleX, 0.0));
    PaddleController paddles(left, right, GameConfig{});

    paddles.move(Side::Left, 5.0);
    TEST_ASSERT(near(paddles.y(Side::Left), 0.8), "clamped to 1 - h");
    paddles.move(Side::Left, 0.1);
    TEST_ASSERT(near(paddles.y(Side::Left), 0.8), "further up is a no-op");

    paddles.move(Side::Right, -5.0);
    TEST_ASSERT(near(paddles.y(Side::Right), -0.8), "clamped to -1 + h");
    TEST_ASSERT(near(paddles.clamp_y(-0.95), -0.8), "clamp_y lower bound");
    TEST_ASSERT(near(paddles.clamp_y(0.3), 0.3), "clamp_y passes in-range values");
}

static void test_random_moves_stay_in_range()
{
    Body left(Vec2(arena::kLeftPaddleX, 0.0));
    Body right(Vec2(arena::kRightPaddleX, 0.0));
    PaddleController paddles(left, right, GameConfig{});
    RandomSource rng(7);

    const double h = paddles.half_height();
    for (int i = 0; i < 2000; ++i)
    {
        const Side side = (i % 2 == 0) ? Side::Left : Side::Right;
        paddles.move(side, rng.uniform(-0.7, 0.7));
        TEST_ASSERT(paddles.y(side) >= arena::kBottom + h, "above lower limit");
        TEST_ASSERT(paddles.y(side) <= arena::kTop - h, "below upper limit");
    }
}

static void test_reset_positions_keeps_x()
{
    Body left(Vec2(arena::kLeftPaddleX, 0.0));
    Body right(Vec2(arena::kRightPaddleX, 0.0));
    PaddleController paddles(left, right, GameConfig{});

    paddles.move(Side::Left, 0.4);
    paddles.move(Side::Right, -0.6);
    paddles.reset_positions();

    TEST_ASSERT(left.position().y == 0.0, "left centered");
    TEST_ASSERT(right.position().y == 0.0, "right centered");
    TEST_ASSERT(left.position().x == arena::kLeftPaddleX, "left x kept");
    TEST_ASSERT(right.position().x == arena::kRightPaddleX, "right x kept");
}

static void test_invalid_config_falls_back()
{
    GameConfig cfg;
    cfg.paddle_y_length = 0.0;
    cfg.paddle_move_step = -1.0;
    Body left(Vec2(arena::kLeftPaddleX, 0.0));
    Body right(Vec2(arena::kRightPaddleX, 0.0));
    PaddleController paddles(left, right, cfg);

    TEST_ASSERT(near(paddles.half_height(), 0.2), "default half height");
    TEST_ASSERT(near(paddles.move_step(), 0.1), "default move step");
}

static void test_custom_length_changes_range()
{
    GameConfig cfg;
    cfg.paddle_y_length = 1.0;
    Body left(Vec2(arena::kLeftPaddleX, 0.0));
    Body right(Vec2(arena::kRightPaddleX, 0.0));
    PaddleController paddles(left, right, cfg);

    paddles.move(Side::Left, 2.0);
    TEST_ASSERT(near(paddles.y(Side::Left), 0.5), "long paddle clamps at 0.5");
}

// =============================================================================
// main
// =============================================================================

int main()
{
    std::printf("=== test_paddle_controller ===\n");
    log::set_level(log::Level::Off);

    RUN_TEST(test_move_single_side);
    RUN_TEST(test_move_clamps_at_walls);
    RUN_TEST(test_random_moves_stay_in_range);
    RUN_TEST(test_reset_positions_keeps_x);
    RUN_TEST(test_invalid_config_falls_back);
    RUN_TEST(test_custom_length_changes_range);

    std::printf("\n%d/%d tests passed\n", sTestsPassed, sTestsPassed + sTestsFailed);
    return sTestsFailed == 0 ? 0 : 1;
}

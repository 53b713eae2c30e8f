/**
 * @file test_ai_controller.cpp
 * @brief Tests for AIController and the difficulty profiles.
 *
 * Tests cover:
 *  1.  Profile constants and difficulty cycling
 *  2.  Difficulty names parse case-insensitively
 *  3.  No movement before the reaction delay elapses
 *  4.  Paddle tracks an approaching ball over several reactions
 *  5.  Target stays within the prediction error of the intercept
 *  6.  Ball moving away drifts the paddle to center without overshoot
 *  7.  Intercept prediction, including wall reflections
 *  8.  Folding large and non-finite values into the arena
 *  9.  AI-driven paddle stays inside the arena
 * 10.  set_difficulty() swaps the profile and restarts the cycle
 */

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>

#include "core/ai_controller.h"
#include "core/arena.h"
#include "core/difficulty.h"
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
// Fixture
// =============================================================================

struct Rig
{
    RandomSource rng;
    Body ball{Vec2(0.0, 0.0)};
    Body left{Vec2(arena::kLeftPaddleX, 0.0)};
    Body right{Vec2(arena::kRightPaddleX, 0.0)};
    PaddleController paddles;
    AIController ai;

    explicit Rig(Difficulty d = Difficulty::Medium, std::uint32_t seed = 1234)
        : rng(seed)
        , paddles(left, right, GameConfig{})
        , ai(paddles, ball, rng, d, Side::Right)
    {
    }
};

// =============================================================================
// Tests
// =============================================================================

static void test_profiles()
{
    const AiProfile& easy = profile_for(Difficulty::Easy);
    const AiProfile& medium = profile_for(Difficulty::Medium);
    const AiProfile& hard = profile_for(Difficulty::Hard);

    TEST_ASSERT(easy.reaction_delay == 15 && near(easy.speed, 0.03), "easy timing");
    TEST_ASSERT(near(easy.accuracy, 0.70) && near(easy.prediction_error, 0.15), "easy accuracy");
    TEST_ASSERT(medium.reaction_delay == 8 && near(medium.speed, 0.05), "medium timing");
    TEST_ASSERT(near(medium.accuracy, 0.85) && near(medium.prediction_error, 0.08), "medium accuracy");
    TEST_ASSERT(hard.reaction_delay == 3 && near(hard.speed, 0.08), "hard timing");
    TEST_ASSERT(near(hard.accuracy, 0.95) && near(hard.prediction_error, 0.03), "hard accuracy");

    TEST_ASSERT(next_difficulty(Difficulty::Easy) == Difficulty::Medium, "easy -> medium");
    TEST_ASSERT(next_difficulty(Difficulty::Medium) == Difficulty::Hard, "medium -> hard");
    TEST_ASSERT(next_difficulty(Difficulty::Hard) == Difficulty::Easy, "hard -> easy");
}

static void test_parse_difficulty()
{
    Difficulty d = Difficulty::Medium;
    TEST_ASSERT(parse_difficulty("HARD", d) && d == Difficulty::Hard, "upper case parsed");
    TEST_ASSERT(parse_difficulty("Easy", d) && d == Difficulty::Easy, "mixed case parsed");
    TEST_ASSERT(!parse_difficulty("nightmare", d), "unknown rejected");
    TEST_ASSERT(d == Difficulty::Easy, "unknown leaves value untouched");
    TEST_ASSERT(std::string(difficulty_name(Difficulty::Medium)) == "medium", "name round trip");
}

static void test_no_move_before_reaction_delay()
{
    Rig rig(Difficulty::Medium);
    rig.ball.set_position(Vec2(0.0, 0.5));
    const Vec2 dir(0.01, 0.0);

    for (int i = 0; i < 7; ++i)
    {
        rig.ai.update(dir);
        TEST_ASSERT(rig.paddles.y(Side::Right) == 0.0, "paddle idle before delay");
    }
    TEST_ASSERT(rig.ai.frame_counter() == 7, "seven frames counted");
}

static void test_tracks_approaching_ball()
{
    Rig rig(Difficulty::Medium);
    rig.ball.set_position(Vec2(0.0, 0.5));
    const Vec2 dir(0.01, 0.0);

    double last = 0.0;
    for (int i = 0; i < 48; ++i)
    {
        rig.ai.update(dir);
        const double y = rig.paddles.y(Side::Right);
        TEST_ASSERT(y >= last - 1e-12, "paddle never moves away from target");
        TEST_ASSERT(y - last <= 0.05 + 1e-12, "step bounded by profile speed");
        last = y;
    }
    TEST_ASSERT(rig.paddles.y(Side::Right) > 0.0, "paddle moved toward the ball");
}

static void test_target_within_prediction_error()
{
    Rig rig(Difficulty::Easy, 99);
    rig.ball.set_position(Vec2(0.0, 0.5));
    const Vec2 dir(0.01, 0.0);

    for (int cycle = 0; cycle < 20; ++cycle)
    {
        for (int i = 0; i < 15; ++i)
            rig.ai.update(dir);
        TEST_ASSERT(std::abs(rig.ai.target_y() - 0.5) <= 0.15 + 1e-12, "target within error band");
    }
}

static void test_drift_to_center_when_ball_leaves()
{
    Rig rig(Difficulty::Hard);
    rig.paddles.move(Side::Right, 0.3);
    const Vec2 away(-0.01, 0.0);

    for (int i = 0; i < 3; ++i)
        rig.ai.update(away);
    TEST_ASSERT(near(rig.paddles.y(Side::Right), 0.26), "drifted at half speed");

    for (int i = 0; i < 60; ++i)
    {
        rig.ai.update(away);
        TEST_ASSERT(rig.paddles.y(Side::Right) >= 0.0, "no overshoot past center");
    }
    TEST_ASSERT(rig.paddles.y(Side::Right) == 0.0, "settled at center");
}

static void test_predict_intercept()
{
    double y = AIController::predict_intercept(Vec2(0.0, 0.0), Vec2(0.01, 0.01), arena::kRightPaddleX);
    TEST_ASSERT(near(y, 0.9), "straight-line intercept");

    y = AIController::predict_intercept(Vec2(0.0, 0.5), Vec2(0.01, 0.01), arena::kRightPaddleX);
    TEST_ASSERT(near(y, 0.6), "reflected off the top wall");

    y = AIController::predict_intercept(Vec2(0.0, -0.5), Vec2(0.01, -0.01), arena::kRightPaddleX);
    TEST_ASSERT(near(y, -0.6), "reflected off the bottom wall");

    y = AIController::predict_intercept(Vec2(0.3, 0.25), Vec2(0.0, 0.02), arena::kRightPaddleX);
    TEST_ASSERT(near(y, 0.25), "zero dx uses current y");
}

static void test_fold_into_arena()
{
    TEST_ASSERT(near(AIController::fold_into_arena(0.4), 0.4), "in range unchanged");
    TEST_ASSERT(near(AIController::fold_into_arena(3.5), -0.5), "two reflections");
    TEST_ASSERT(near(AIController::fold_into_arena(-1.5), -0.5), "bottom reflection");

    const double big = AIController::fold_into_arena(1.0e9 + 0.25);
    TEST_ASSERT(big >= -1.0 && big <= 1.0, "huge value folded into range");

    TEST_ASSERT(AIController::fold_into_arena(std::numeric_limits<double>::quiet_NaN()) == 0.0, "NaN maps to center");
    TEST_ASSERT(AIController::fold_into_arena(std::numeric_limits<double>::infinity()) == 0.0, "inf maps to center");
}

static void test_ai_paddle_stays_in_arena()
{
    Rig rig(Difficulty::Hard, 5);
    const double h = rig.paddles.half_height();
    rig.ball.set_position(Vec2(0.0, 0.97));
    const Vec2 dir(0.01, 0.0);

    for (int i = 0; i < 300; ++i)
    {
        rig.ai.update(dir);
        const double y = rig.paddles.y(Side::Right);
        TEST_ASSERT(y <= arena::kTop - h && y >= arena::kBottom + h, "paddle inside range");
    }
    TEST_ASSERT(near(rig.paddles.y(Side::Right), arena::kTop - h), "paddle pinned at top limit");
}

static void test_set_difficulty()
{
    Rig rig(Difficulty::Easy);
    rig.ball.set_position(Vec2(0.0, 0.5));
    const Vec2 dir(0.01, 0.0);

    for (int i = 0; i < 5; ++i)
        rig.ai.update(dir);
    TEST_ASSERT(rig.ai.frame_counter() == 5, "frames counted");

    rig.ai.set_difficulty(Difficulty::Hard);
    TEST_ASSERT(rig.ai.difficulty() == Difficulty::Hard, "difficulty changed");
    TEST_ASSERT(rig.ai.profile().reaction_delay == 3, "hard profile active");
    TEST_ASSERT(rig.ai.frame_counter() == 0, "cycle restarted");
    TEST_ASSERT(rig.ai.target_y() == 0.0, "target cleared");

    rig.ai.update(dir);
    rig.ai.update(dir);
    TEST_ASSERT(rig.paddles.y(Side::Right) == 0.0, "still waiting for third frame");
}

// =============================================================================
// main
// =============================================================================

int main()
{
    std::printf("=== test_ai_controller ===\n");
    log::set_level(log::Level::Off);

    RUN_TEST(test_profiles);
    RUN_TEST(test_parse_difficulty);
    RUN_TEST(test_no_move_before_reaction_delay);
    RUN_TEST(test_tracks_approaching_ball);
    RUN_TEST(test_target_within_prediction_error);
    RUN_TEST(test_drift_to_center_when_ball_leaves);
    RUN_TEST(test_predict_intercept);
    RUN_TEST(test_fold_into_arena);
    RUN_TEST(test_ai_paddle_stays_in_arena);
    RUN_TEST(test_set_difficulty);

    std::printf("\n%d/%d tests passed\n", sTestsPassed, sTestsPassed + sTestsFailed);
    return sTestsFailed == 0 ? 0 : 1;
}

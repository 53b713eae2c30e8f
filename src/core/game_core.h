/**
 * @file game_core.h
 * @brief Match orchestration: tick ordering, pause, reset and input dispatch
 *
 * This file contains the platform-independent entry point of the
 * simulation. Front ends feed it InputEvents and read a GameSnapshot back
 * after each one; nothing in here knows about windows, terminals or
 * renderers.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "core/ai_controller.h"
#include "core/arena.h"
#include "core/ball_controller.h"
#include "core/difficulty.h"
#include "core/game_config.h"
#include "core/game_events.h"
#include "core/input_event.h"
#include "core/main_menu.h"
#include "core/movable_entity.h"
#include "core/paddle_controller.h"
#include "core/random_source.h"
#include "core/score_manager.h"

namespace pongsim {

/**
 * @brief Everything a front end needs to draw one frame
 */
struct GameSnapshot {
    Vec2 ball;                         ///< Ball center
    Vec2 ball_direction;               ///< Ball velocity per tick
    double ball_radius = 0.0;
    double left_paddle_y = 0.0;        ///< Left paddle center Y
    double right_paddle_y = 0.0;       ///< Right paddle center Y
    double paddle_half_height = 0.0;
    std::array<int, 2> scores{{0, 0}}; ///< [left, right]
    bool game_over = false;
    std::optional<Side> winner;
    bool paused = false;
    bool ai_enabled = false;
    Difficulty difficulty = Difficulty::Medium;
    int rally = 0;
    int longest_rally = 0;
    bool menu_visible = false;
    MenuOption menu_selection = MenuOption::SinglePlayer;
    long ticks = 0;                    ///< Simulated ticks since the last reset
};

/**
 * @brief Owns the controllers and drives them one event at a time
 *
 * Per tick the ball is fully stepped (including any point or game over it
 * causes) before the AI sees the resulting direction. While paused, on the
 * menu, or after game over, ticks change nothing but key events are still
 * handled, so the player can resume or reset.
 *
 * GameCore is neither copyable nor movable: the controllers hold references
 * to sibling members.
 */
class GameCore {
public:
    /**
     * @brief Construct a match
     *
     * @param config Configuration; invalid values are repaired with a warning
     * @param seed Fixed random seed, or nullopt for a nondeterministic one
     */
    explicit GameCore(const GameConfig& config = GameConfig{},
                      std::optional<std::uint32_t> seed = std::nullopt);

    GameCore(const GameCore&) = delete;
    GameCore& operator=(const GameCore&) = delete;

    /**
     * @brief Dispatch one input event (key intent or tick)
     */
    void handle(const InputEvent& event);

    /**
     * @brief Advance one tick: ball first, then the AI
     */
    void tick();

    /**
     * @brief Apply a key intent
     */
    void press(const KeyPress& key);

    /**
     * @brief Flip the pause flag; ignored after game over
     */
    void toggle_pause();

    /**
     * @brief Set the pause flag; no-op if already in that state
     */
    void set_paused(bool paused);

    /**
     * @brief Restart the match: serve, center paddles, zero scores, resume
     *
     * No-op if the match is already in its initial state.
     */
    void reset();

    void toggle_ai();
    void set_ai_enabled(bool enabled);

    /**
     * @brief Advance easy -> medium -> hard -> easy
     */
    void cycle_difficulty();
    void set_difficulty(Difficulty difficulty);

    /**
     * @brief true when nothing has happened since the last reset
     */
    bool is_initial_state() const;

    GameSnapshot snapshot() const;

    /**
     * @brief Observer hooks; assign to subscribe
     */
    GameEvents& events() { return observers; }

    bool paused() const { return is_paused; }
    bool ai_enabled() const { return ai_on; }
    Difficulty difficulty() const { return level; }
    const GameConfig& config() const { return cfg; }

    const BallController& ball() const { return ball_ctl; }
    BallController& ball() { return ball_ctl; }
    const PaddleController& paddles() const { return paddle_ctl; }
    PaddleController& paddles() { return paddle_ctl; }
    const ScoreManager& scores() const { return score_mgr; }
    ScoreManager& scores() { return score_mgr; }
    const AIController& ai() const { return ai_ctl; }
    const MainMenu& menu() const { return main_menu; }

private:
    void on_game_over(Side winner);
    void on_menu_selection(MenuOption option);

    GameConfig cfg;
    GameEvents observers;  ///< Hooks set by the front end
    GameEvents internal;   ///< Hooks given to the controllers; forward to observers
    RandomSource rng;

    Body ball_body;
    Body left_body;
    Body right_body;

    PaddleController paddle_ctl;
    ScoreManager score_mgr;
    BallController ball_ctl;
    AIController ai_ctl;
    MainMenu main_menu;

    bool is_paused = false;
    bool ai_on = false;
    Difficulty level = Difficulty::Medium;
};

} // namespace pongsim

/**
 * @file score_manager.h
 * @brief Score counters and the win / game-over state machine
 */

#pragma once

#include <array>
#include <optional>

#include "core/arena.h"

namespace pongsim {

struct GameEvents;

/**
 * @brief Match state
 */
enum class MatchState {
    Playing,   ///< Points are being played
    GameOver   ///< A side reached the win score; counters frozen until reset()
};

/**
 * @brief Tracks both scores and decides when the match is over
 *
 * The transition to GameOver happens inside score_point() as soon as either
 * counter reaches the win score, and fires GameEvents::on_game_over exactly
 * once. From then on score_point() does nothing until reset().
 */
class ScoreManager {
public:
    static constexpr int kDefaultWinScore = 11;

    /**
     * @param events Hooks to fire on game over (kept by reference)
     * @param win_score Points needed to win; non-positive falls back to 11
     */
    explicit ScoreManager(const GameEvents& events, int win_score = kDefaultWinScore);

    /**
     * @brief Award a point
     *
     * No-op once the match is over.
     *
     * @param side Side that won the point
     */
    void score_point(Side side);

    /**
     * @brief Zero both counters and return to Playing
     */
    void reset();

    /**
     * @brief Winning side, or nullopt while still Playing
     */
    std::optional<Side> get_winner() const;

    /**
     * @brief Change the win score (clamped to at least 1)
     *
     * Takes effect at the next score_point().
     */
    void set_win_score(int win_score);

    int score(Side side) const { return counters[static_cast<int>(side)]; }
    const std::array<int, 2>& scores() const { return counters; }
    int win_score() const { return target; }
    MatchState state() const { return st; }
    bool game_over() const { return st == MatchState::GameOver; }

private:
    const GameEvents& events;
    std::array<int, 2> counters{{0, 0}};  ///< [left, right]
    int target;
    MatchState st = MatchState::Playing;
    std::optional<Side> winner;
};

} // namespace pongsim

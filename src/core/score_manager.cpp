/**
 * @file score_manager.cpp
 * @brief Implementation of scoring and the win condition
 */

#include "core/score_manager.h"

#include <algorithm>

#include "core/game_events.h"
#include "core/log.h"

namespace pongsim {

ScoreManager::ScoreManager(const GameEvents& ev, int win_score)
: events(ev), target(win_score) {
    if (target <= 0) {
        log::warn() << "Invalid win score " << win_score << ", using " << kDefaultWinScore;
        target = kDefaultWinScore;
    }
}

void ScoreManager::score_point(Side side) {
    if (st == MatchState::GameOver) return;

    ++counters[static_cast<int>(side)];
    log::info() << "Player " << player_number(side) << " scored ("
                << counters[0] << " - " << counters[1] << ")";

    if (counters[static_cast<int>(side)] >= target) {
        st = MatchState::GameOver;
        winner = side;
        log::info() << "Player " << player_number(side) << " wins!";
        events.game_over(side);
    }
}

void ScoreManager::reset() {
    counters = {{0, 0}};
    st = MatchState::Playing;
    winner.reset();
    log::info() << "Scores reset to 0-0";
}

std::optional<Side> ScoreManager::get_winner() const {
    if (st != MatchState::GameOver) return std::nullopt;
    return winner;
}

void ScoreManager::set_win_score(int win_score) {
    target = std::max(1, win_score);
    log::info() << "Win score set to " << target;
}

} // namespace pongsim

/**
 * @file game_core.cpp
 * @brief Implementation of match orchestration
 */

#include "core/game_core.h"

#include <variant>

#include "core/log.h"

namespace pongsim {

GameCore::GameCore(const GameConfig& config, std::optional<std::uint32_t> seed)
: cfg(config.sanitized()),
  rng(seed ? RandomSource(*seed) : RandomSource()),
  ball_body(Vec2(0.0, 0.0)),
  left_body(Vec2(arena::kLeftPaddleX, 0.0)),
  right_body(Vec2(arena::kRightPaddleX, 0.0)),
  paddle_ctl(left_body, right_body, cfg),
  score_mgr(internal, cfg.win_score),
  ball_ctl(ball_body, paddle_ctl, score_mgr, internal, rng, cfg),
  ai_ctl(paddle_ctl, ball_body, rng, cfg.default_difficulty, Side::Right),
  main_menu(cfg.show_menu),
  ai_on(cfg.ai_enabled),
  level(cfg.default_difficulty) {
    internal.on_paddle_hit = [this](Side s) { observers.paddle_hit(s); };
    internal.on_score = [this](Side s) { observers.score(s); };
    internal.on_wall_hit = [this]() { observers.wall_hit(); };
    internal.on_game_over = [this](Side s) { on_game_over(s); };
    main_menu.on_selection = [this](MenuOption o) { on_menu_selection(o); };

    ball_ctl.reset();
    log::info() << "Game initialized (win score " << score_mgr.win_score()
                << ", AI " << (ai_on ? "on" : "off")
                << ", difficulty " << difficulty_name(level) << ")";
}

void GameCore::handle(const InputEvent& event) {
    if (const KeyPress* key = std::get_if<KeyPress>(&event)) {
        press(*key);
    } else {
        tick();
    }
}

void GameCore::tick() {
    if (main_menu.visible() || is_paused || score_mgr.game_over()) return;

    ball_ctl.tick();
    if (ai_on) ai_ctl.update(ball_ctl.direction());
}

void GameCore::press(const KeyPress& key) {
    if (main_menu.visible()) {
        switch (key.action) {
            case Action::MenuUp: main_menu.select_previous(); break;
            case Action::MenuDown: main_menu.select_next(); break;
            case Action::MenuSelect: main_menu.confirm(); break;
            default: break;
        }
        return;
    }

    switch (key.action) {
        case Action::PaddleUp:
        case Action::PaddleDown: {
            if (is_paused || score_mgr.game_over()) return;
            double step = paddle_ctl.move_step();
            paddle_ctl.move(key.side, key.action == Action::PaddleUp ? step : -step);
            break;
        }
        case Action::TogglePause: toggle_pause(); break;
        case Action::Reset: reset(); break;
        case Action::ToggleAi: toggle_ai(); break;
        case Action::CycleDifficulty: cycle_difficulty(); break;
        case Action::MenuUp:
        case Action::MenuDown:
        case Action::MenuSelect:
            break;
    }
}

void GameCore::toggle_pause() {
    if (score_mgr.game_over()) return;
    is_paused = !is_paused;
    log::info() << "Game " << (is_paused ? "paused" : "resumed");
}

void GameCore::set_paused(bool paused) {
    if (paused == is_paused) return;
    toggle_pause();
}

void GameCore::reset() {
    if (is_initial_state()) return;

    ball_ctl.reset();
    ball_ctl.clear_longest_rally();
    paddle_ctl.reset_positions();
    score_mgr.reset();
    ai_ctl.reset();
    is_paused = false;
    log::info() << "Game reset. Ball position, paddles, and scores reset";
}

void GameCore::toggle_ai() {
    ai_on = !ai_on;
    if (ai_on) ai_ctl.reset();
    log::info() << "Game mode changed to: " << (ai_on ? "AI" : "Two-player");
}

void GameCore::set_ai_enabled(bool enabled) {
    if (enabled != ai_on) toggle_ai();
}

void GameCore::cycle_difficulty() {
    set_difficulty(next_difficulty(level));
}

void GameCore::set_difficulty(Difficulty difficulty) {
    level = difficulty;
    ai_ctl.set_difficulty(difficulty);
}

bool GameCore::is_initial_state() const {
    Vec2 b = ball_ctl.position();
    return ball_ctl.elapsed_ticks() == 0
        && ball_ctl.rally() == 0
        && b.x == 0.0 && b.y == 0.0
        && paddle_ctl.y(Side::Left) == 0.0
        && paddle_ctl.y(Side::Right) == 0.0
        && score_mgr.state() == MatchState::Playing
        && score_mgr.score(Side::Left) == 0
        && score_mgr.score(Side::Right) == 0
        && !is_paused;
}

GameSnapshot GameCore::snapshot() const {
    GameSnapshot s;
    s.ball = ball_ctl.position();
    s.ball_direction = ball_ctl.direction();
    s.ball_radius = ball_ctl.radius();
    s.left_paddle_y = paddle_ctl.y(Side::Left);
    s.right_paddle_y = paddle_ctl.y(Side::Right);
    s.paddle_half_height = paddle_ctl.half_height();
    s.scores = score_mgr.scores();
    s.game_over = score_mgr.game_over();
    s.winner = score_mgr.get_winner();
    s.paused = is_paused;
    s.ai_enabled = ai_on;
    s.difficulty = level;
    s.rally = ball_ctl.rally();
    s.longest_rally = ball_ctl.longest_rally();
    s.menu_visible = main_menu.visible();
    s.menu_selection = main_menu.selected();
    s.ticks = ball_ctl.elapsed_ticks();
    return s;
}

void GameCore::on_game_over(Side winner) {
    is_paused = true;
    const char* name = winner == Side::Left ? "Player 1" : (ai_on ? "AI" : "Player 2");
    log::info() << "Game over! " << name << " wins!";
    observers.game_over(winner);
}

void GameCore::on_menu_selection(MenuOption option) {
    set_ai_enabled(option == MenuOption::SinglePlayer);
    is_paused = false;
}

} // namespace pongsim

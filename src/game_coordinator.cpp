//
//  game_coordinator.cpp
//  othello - Game coordination implementation
//
//  Manages game flow with Player hierarchy
//

#include <format>
#include <iostream>
#include <stdexcept>
#include "game_coordinator.hpp"
#include "ansi.h"

namespace othello {

//===============================================================================
// CONSTRUCTOR
//===============================================================================

GameCoordinator::GameCoordinator(const cli::Config& config, std::istream& in, std::ostream& out)
    : config_(config), input_(in, out), out_(out) {

    const Difficulty difficulty = config.white.type == PlayerType::Computer
        ? config.difficulty_for(config.white)
        : config.difficulty_for(config.black);
    state_ = new_game(config.mode(), difficulty);

    black_ = PlayerFactory::create_player(config.black, 1, config_, input_);
    white_ = PlayerFactory::create_player(config.white, 2, config_, input_);

    if (!black_ || !white_) {
        throw std::runtime_error("Failed to create players");
    }

    black_->on_game_start(state_);
    white_->on_game_start(state_);
}

//===============================================================================
// GAME LOOP
//===============================================================================

int GameCoordinator::run_game() {
    while (!state_.is_over() && !quit_) {
        ui::refresh_display(out_, state_, get_black_name(), get_white_name());
        make_player_move();
    }

    if (!quit_) {
        ui::draw_board(out_, state_, false);
        ui::draw_result(out_, state_, get_black_name(), get_white_name());
    }

    return 0;
}

void GameCoordinator::make_player_move() {
    PlayerImpl* current = get_current_player();
    const PlayerMoveResult result = current->make_move(state_);

    switch (result.action) {
        case PlayerMoveResult::Action::Quit:
            quit_ = true;
            out_ << std::format("  {}{} left the game.{}\n", COLOR_YELLOW, current->get_name(), COLOR_RESET);
            return;

        case PlayerMoveResult::Action::Undo:
            handle_undo();
            return;

        case PlayerMoveResult::Action::Move:
            break;
    }

    auto next = advance_turn(state_, result.pos);
    if (!next) {
        out_ << std::format("  {}{}: {} at {}{}\n", COLOR_BRIGHT_RED, current->get_name(),
                            engine_error_to_string(next.error()), to_notation(result.pos), COLOR_RESET);
        return;
    }

    if (current->get_type() == PlayerType::Computer) {
        ui::draw_ai_report(out_, current->get_name(), result.pos, result.stats, result.time_taken);
    }

    state_ = std::move(*next);
}

void GameCoordinator::handle_undo() {
    for (int moves = 1; can_undo(state_, moves); ++moves) {
        auto previous = undo_moves(state_, moves);
        if (!previous) {
            break;
        }
        if (player_for(previous->current_player)->get_type() == PlayerType::Human) {
            state_ = std::move(*previous);
            out_ << std::format("  {}Took back {} move{}.{}\n", COLOR_BRIGHT_GREEN,
                                moves, moves == 1 ? "" : "s", COLOR_RESET);
            return;
        }
    }

    out_ << std::format("  {}{}{}\n", COLOR_RED, engine_error_to_string(EngineError::NothingToUndo), COLOR_RESET);
}

} // namespace othello

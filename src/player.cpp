//
//  player.cpp
//  othello - Player implementation for different player types
//
//  Implementation of abstract Player hierarchy
//

#include <format>
#include <iostream>
#include "player.hpp"
#include "ansi.h"

namespace othello {

//===============================================================================
// HUMAN PLAYER IMPLEMENTATION
//===============================================================================

PlayerMoveResult HumanPlayer::make_move(const GameState& state) {
    const auto start_time = now();
    std::ostream& out = input_.out();

    while (true) {
        const auto line = input_.read_line(std::format("{} ({}) >", name_,
                                                       player_to_string(state.current_player)));
        if (!line) {
            return PlayerMoveResult::quit();
        }

        const auto command = ui::parse_command(*line);
        if (!command) {
            out << std::format("  {}{}{}\n", COLOR_RED, command.error(), COLOR_RESET);
            continue;
        }

        switch (command->type) {
            case ui::CommandType::Quit:
                return PlayerMoveResult::quit();

            case ui::CommandType::Undo:
                if (!undo_enabled_) {
                    out << std::format("  {}Undo is disabled, start with --undo{}\n", COLOR_RED, COLOR_RESET);
                    break;
                }
                return PlayerMoveResult::undo();

            case ui::CommandType::Rules:
                ui::display_rules(out);
                ui::draw_board(out, state);
                break;

            case ui::CommandType::Hint: {
                const Position hint = greedy_move(state.board, state.legal_moves);
                out << std::format("  {}Hint: try {}{}\n", COLOR_BRIGHT_GREEN, to_notation(hint), COLOR_RESET);
                break;
            }

            case ui::CommandType::Move:
                if (!is_legal_move(state.board, command->pos, state.current_player)) {
                    out << std::format("  {}{} is not a legal move{}\n",
                                       COLOR_RED, to_notation(command->pos), COLOR_RESET);
                    break;
                }
                return PlayerMoveResult::move(command->pos, elapsed_seconds(start_time));
        }
    }
}

//===============================================================================
// COMPUTER PLAYER IMPLEMENTATION
//===============================================================================

PlayerMoveResult ComputerPlayer::make_move(const GameState& state) {
    const auto start_time = now();
    SearchStats stats;

    auto choice = choose_move(state.board, state.current_player, difficulty_, rng_, &stats);
    if (!choice) {
        // The coordinator never asks a side without moves; treat it as a resignation
        std::cerr << std::format("{}{}: {}{}\n", COLOR_BRIGHT_RED, name_,
                                 engine_error_to_string(choice.error()), COLOR_RESET);
        return PlayerMoveResult::quit();
    }

    return PlayerMoveResult::move(*choice, elapsed_seconds(start_time), stats);
}

//===============================================================================
// PLAYER FACTORY IMPLEMENTATION
//===============================================================================

std::unique_ptr<PlayerImpl> PlayerFactory::create_player(const cli::PlayerConfig& seat, int player_number,
                                                         const cli::Config& config,
                                                         ui::TerminalInput& input) {
    switch (seat.type) {
        case PlayerType::Human:
            return std::make_unique<HumanPlayer>(
                seat.name.empty() ? generate_default_name(seat.type, player_number) : seat.name,
                input, config.enable_undo);

        case PlayerType::Computer: {
            const Difficulty difficulty = config.difficulty_for(seat);
            // Distinct streams for two seeded computers
            std::optional<uint32_t> seed;
            if (config.seed) {
                seed = *config.seed + static_cast<uint32_t>(player_number - 1);
            }
            return std::make_unique<ComputerPlayer>(
                seat.name.empty() ? get_classical_name(difficulty) : seat.name,
                difficulty, seed);
        }
    }

    return nullptr;
}

std::string PlayerFactory::get_classical_name(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:
            return "Plato";
        case Difficulty::Medium:
            return "Socrates";
        case Difficulty::Hard:
            return "Archimedes";
    }
    return "Computer";
}

std::string PlayerFactory::generate_default_name(PlayerType type, int player_number) {
    switch (type) {
        case PlayerType::Human:
            return std::format("Player {}", player_number);
        case PlayerType::Computer:
            return std::format("Computer {}", player_number);
    }
    return "Unknown";
}

} // namespace othello

//
//  ui.cpp
//  othello - Modern C++23 User Interface module for display and input handling
//
//  Line-oriented rendering and command parsing for the terminal game
//

#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <string>
#include "ui.hpp"
#include "ansi.h"

namespace othello::ui {

//===============================================================================
// COMMAND PARSING
//===============================================================================

namespace {

    std::string normalize(std::string_view line) {
        std::string text;
        for (char c : line) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                text += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
        }
        return text;
    }

    std::string_view disc_glyph(Player player) {
        return player == Player::Black ? unicode::BLACK : unicode::WHITE;
    }

    const char* disc_color(Player player) {
        return player == Player::Black ? COLOR_BRIGHT_WHITE : COLOR_BRIGHT_CYAN;
    }

    bool is_legal_here(const GameState& state, const Position& pos) {
        return std::ranges::any_of(state.legal_moves, [&pos](const Move& m) { return m.pos == pos; });
    }

} // namespace

std::expected<Command, std::string> parse_command(std::string_view line) {
    const std::string text = normalize(line);

    if (text.empty()) {
        return std::unexpected("Enter a cell such as d3, or ? for help");
    }

    if (text == "q" || text == "quit") return Command{CommandType::Quit, {}};
    if (text == "u" || text == "undo") return Command{CommandType::Undo, {}};
    if (text == "h" || text == "hint") return Command{CommandType::Hint, {}};
    if (text == "?" || text == "help") return Command{CommandType::Rules, {}};

    if (auto pos = from_notation(text)) {
        return Command{CommandType::Move, *pos};
    }

    return std::unexpected(std::format("'{}' is not a cell on the board (a1 to h8)", line));
}

//===============================================================================
// TERMINAL INPUT IMPLEMENTATION
//===============================================================================

std::optional<std::string> TerminalInput::read_line(std::string_view prompt) {
    out_ << std::format("{}{}{} ", COLOR_YELLOW, prompt, COLOR_RESET);
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    return line;
}

//===============================================================================
// DISPLAY FUNCTIONS
//===============================================================================

void draw_game_header(std::ostream& out) {
    out << '\n';
    out << std::format(" {}{} {}(v{}){}\n\n",
                       COLOR_YELLOW, GAME_DESCRIPTION, COLOR_RED, GAME_VERSION, COLOR_RESET);
    out << std::format(" {}{}HINT:{}\n", ESCAPE_CODE_BOLD, COLOR_MAGENTA, COLOR_RESET);
    out << std::format(" {}{}{}\n", COLOR_MAGENTA, GAME_RULES_BRIEF, COLOR_RESET);
    out << std::format(" {}{}{}\n", COLOR_BRIGHT_CYAN, GAME_RULES_LONG, COLOR_RESET);
}

void draw_board(std::ostream& out, const GameState& state, bool show_legal) {
    out << "\n    ";
    for (int col = 0; col < Board::size; ++col) {
        out << std::format("{}{}{} ", COLOR_GREEN, static_cast<char>('a' + col), COLOR_RESET);
    }
    out << '\n';

    for (int row = 0; row < Board::size; ++row) {
        out << std::format("  {}{}{} ", COLOR_GREEN, row + 1, COLOR_RESET);

        for (int col = 0; col < Board::size; ++col) {
            const Position pos{row, col};
            const Player cell = state.board.at(pos);

            if (cell != Player::Empty) {
                const bool is_last = state.last_move && *state.last_move == pos;
                out << std::format("{}{}{}{} ", is_last ? ESCAPE_CODE_BOLD : "",
                                   disc_color(cell), disc_glyph(cell), COLOR_RESET);
            } else if (show_legal && is_legal_here(state, pos)) {
                out << std::format("{}{}{} ", COLOR_YELLOW, unicode::LEGAL, COLOR_RESET);
            } else {
                out << std::format("{} ", unicode::EMPTY);
            }
        }

        out << std::format("{}{}{}\n", COLOR_GREEN, row + 1, COLOR_RESET);
    }

    out << "    ";
    for (int col = 0; col < Board::size; ++col) {
        out << std::format("{}{}{} ", COLOR_GREEN, static_cast<char>('a' + col), COLOR_RESET);
    }
    out << "\n\n";
}

void draw_status(std::ostream& out, const GameState& state,
                 std::string_view black_name, std::string_view white_name) {
    out << std::format("  {}{} {}{}: {:2}    {}{} {}{}: {:2}\n",
                       disc_color(Player::Black), unicode::BLACK, black_name, COLOR_RESET,
                       state.black_count(),
                       disc_color(Player::White), unicode::WHITE, white_name, COLOR_RESET,
                       state.white_count());

    if (state.last_move) {
        const auto& record = state.move_history.back();
        out << std::format("  Last move: {} {} flipping {}\n",
                           player_to_string(record.player), to_notation(record.pos), record.flip_count);
    }

    if (state.passed) {
        out << std::format("  {}{} has no legal move and passes.{}\n",
                           COLOR_BRIGHT_RED, player_to_string(other_player(state.current_player)),
                           COLOR_RESET);
    }

    if (!state.is_over()) {
        const std::string_view name = state.current_player == Player::Black ? black_name : white_name;
        out << std::format("  {}To move: {} ({}), {} legal moves{}\n",
                           COLOR_YELLOW, name, player_to_string(state.current_player),
                           state.legal_moves.size(), COLOR_RESET);
    }
}

void draw_ai_report(std::ostream& out, std::string_view name, const Position& pos,
                    const SearchStats& stats, double seconds) {
    if (stats.depth > 0) {
        out << std::format("  {}{} plays {} [depth {} | {} positions | {} cutoffs | {:.2f}s]{}\n",
                           COLOR_BRIGHT_BLUE, name, to_notation(pos), stats.depth,
                           stats.nodes_visited, stats.cutoffs, seconds, COLOR_RESET);
    } else {
        out << std::format("  {}{} plays {} [{} candidates | {:.2f}s]{}\n",
                           COLOR_BRIGHT_BLUE, name, to_notation(pos),
                           stats.nodes_visited, seconds, COLOR_RESET);
    }
}

void draw_result(std::ostream& out, const GameState& state,
                 std::string_view black_name, std::string_view white_name) {
    out << std::format("\n  {}{}GAME OVER{}  {} {} : {} {}\n",
                       ESCAPE_CODE_BOLD, COLOR_BRIGHT_MAGENTA, COLOR_RESET,
                       black_name, state.black_count(), state.white_count(), white_name);

    if (state.status == GameStatus::Draw) {
        out << std::format("  {}It's a draw!{}\n\n", COLOR_YELLOW, COLOR_RESET);
    } else if (state.winner) {
        const std::string_view name = *state.winner == Player::Black ? black_name : white_name;
        out << std::format("  {}{} ({}) wins!{}\n\n",
                           COLOR_BRIGHT_GREEN, name, player_to_string(*state.winner), COLOR_RESET);
    }
}

void display_rules(std::ostream& out) {
    out << std::format("{}═══════════════════════════════════════════════════════════════════════════{}\n",
                       COLOR_RESET, COLOR_RESET);
    out << "                         OTHELLO RULES & HELP\n";
    out << std::format("{}═══════════════════════════════════════════════════════════════════════════{}\n",
                       COLOR_RESET, COLOR_RESET);
    out << GAME_RULES_LONG << '\n';

    out << std::format("{}GAME PIECES{}\n", ESCAPE_CODE_BOLD, COLOR_RESET);
    out << std::format("   {}{}{}   Black, moves first\n", disc_color(Player::Black), unicode::BLACK, COLOR_RESET);
    out << std::format("   {}{}{}   White\n", disc_color(Player::White), unicode::WHITE, COLOR_RESET);
    out << std::format("   {}{}{}   A legal move for the side to play\n\n", COLOR_YELLOW, unicode::LEGAL, COLOR_RESET);

    out << std::format("{}COMMANDS{}", ESCAPE_CODE_BOLD, COLOR_RESET);
    out << GAME_RULES_BRIEF << '\n';
}

void refresh_display(std::ostream& out, const GameState& state,
                     std::string_view black_name, std::string_view white_name) {
    draw_board(out, state);
    draw_status(out, state, black_name, white_name);
}

} // namespace othello::ui

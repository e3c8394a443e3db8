//
//  ui.hpp
//  othello - Modern C++23 User Interface module for display and input handling
//
//  Line-oriented rendering and command parsing for the terminal game
//

#pragma once

#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include "othello.hpp"
#include "game.hpp"
#include "ai.hpp"

namespace othello::ui {

//===============================================================================
// DISPLAY CONSTANTS
//===============================================================================

namespace unicode {
    inline constexpr std::string_view BLACK = "●";
    inline constexpr std::string_view WHITE = "○";
    inline constexpr std::string_view EMPTY = "·";
    inline constexpr std::string_view LEGAL = "∗";
}

//===============================================================================
// COMMANDS
//===============================================================================

enum class CommandType : uint8_t {
    Move,
    Undo,
    Hint,
    Rules,
    Quit
};

struct Command {
    CommandType type = CommandType::Quit;
    Position pos;               // Move only
};

/**
 * Parses one line of human input: a cell such as "d3", or one of
 * u (undo), h (hint), ? (rules), q (quit). Surrounding blanks and letter
 * case are ignored.
 *
 * @return The command, or a message describing why the line was rejected
 */
[[nodiscard]] std::expected<Command, std::string> parse_command(std::string_view line);

//===============================================================================
// INPUT HANDLING CLASS
//===============================================================================

/**
 * Prompted line reader over an input stream
 */
class TerminalInput {
public:
    TerminalInput(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    TerminalInput(const TerminalInput&) = delete;
    TerminalInput& operator=(const TerminalInput&) = delete;

    /**
     * Prints prompt and reads one line.
     * @return The line, or nullopt once the input is exhausted
     */
    [[nodiscard]] std::optional<std::string> read_line(std::string_view prompt);

    std::ostream& out() { return out_; }

private:
    std::istream& in_;
    std::ostream& out_;
};

//===============================================================================
// DISPLAY FUNCTIONS
//===============================================================================

void draw_game_header(std::ostream& out);

/**
 * Draws the board with column letters and row numbers. The last move is
 * highlighted, and the legal moves of the side to move are marked when
 * show_legal is set.
 */
void draw_board(std::ostream& out, const GameState& state, bool show_legal = true);

void draw_status(std::ostream& out, const GameState& state,
                 std::string_view black_name, std::string_view white_name);

// One-line summary of a computer move: cell, flips, depth, nodes and time
void draw_ai_report(std::ostream& out, std::string_view name, const Position& pos,
                    const SearchStats& stats, double seconds);

void draw_result(std::ostream& out, const GameState& state,
                 std::string_view black_name, std::string_view white_name);

void display_rules(std::ostream& out);

void refresh_display(std::ostream& out, const GameState& state,
                     std::string_view black_name, std::string_view white_name);

} // namespace othello::ui

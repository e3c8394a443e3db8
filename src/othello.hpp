//
//  othello.hpp
//  othello - Modern C++23 Core Types and Constants
//
//  Shared vocabulary of the rules engine, the AI and the hosts
//

#pragma once

#include <array>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <functional>

namespace othello {

//===============================================================================
// GAME METADATA
//===============================================================================

inline constexpr std::string_view GAME_NAME = "Othello";
inline constexpr std::string_view GAME_VERSION = "1.0.0";
inline constexpr std::string_view GAME_DESCRIPTION = "Othello, also known as Reversi";

inline constexpr std::string_view GAME_RULES_BRIEF = R"(
  d3, c4, ...      ───→ place a disc (column letter, row number),
  H                ───→ ask for a hint,
  U                ───→ undo your last move (if --undo is enabled),
  ?                ───→ show game rules,
  Q                ───→ quit game.
)";

inline constexpr std::string_view GAME_RULES_LONG = R"(
Othello is a two-player strategy game played on an 8x8 board. Black moves
first. A move places a disc so that one or more straight lines of opposing
discs are sandwiched between the new disc and another disc of your colour;
every sandwiched disc is flipped to your colour. A move that flips nothing is
not allowed.

If you have no legal move your turn is skipped. The game ends when the board
is full or neither side can move, and the side with more discs wins.

Corners can never be flipped, so they are worth fighting for. Squares next to
an empty corner tend to hand that corner to your opponent.
)";

//===============================================================================
// GAME CONSTANTS
//===============================================================================

inline constexpr int BOARD_SIZE = 8;
inline constexpr int NUM_DIRECTIONS = 8;

//===============================================================================
// TYPE DEFINITIONS
//===============================================================================

// Occupant of a cell; Black and White are the two sides
enum class Player : int8_t {
    Empty = 0,
    Black = 1,      // Moves first
    White = -1
};

enum class PlayerType : uint8_t {
    Human,
    Computer
};

struct Position {
    int row, col;

    constexpr Position() noexcept : row(0), col(0) {}
    constexpr Position(int row_, int col_) noexcept : row(row_), col(col_) {}

    constexpr auto operator<=>(const Position&) const = default;

    constexpr bool is_valid(int board_size = BOARD_SIZE) const noexcept {
        return row >= 0 && col >= 0 && row < board_size && col < board_size;
    }

    constexpr Position operator+(const Position& other) const noexcept {
        return {row + other.row, col + other.col};
    }

    constexpr Position operator*(int factor) const noexcept {
        return {row * factor, col * factor};
    }
};

// Unit steps to the eight neighbours
inline constexpr std::array<Position, NUM_DIRECTIONS> DIRECTIONS = {{
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1},          { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1}
}};

//===============================================================================
// GAME STATE ENUMS
//===============================================================================

enum class GameStatus : uint8_t {
    Playing,
    Won,
    Draw
};

enum class GameMode : uint8_t {
    PlayerVsPlayer,
    PlayerVsComputer
};

enum class Difficulty : uint8_t {
    Easy,       // uniform random
    Medium,     // greedy heuristic
    Hard        // minimax with alpha-beta
};

//===============================================================================
// ERRORS
//===============================================================================

enum class EngineError : uint8_t {
    IllegalMove,
    NoLegalMoves,
    GameOver,
    NothingToUndo
};

[[nodiscard]] constexpr std::string_view engine_error_to_string(EngineError error) noexcept {
    switch (error) {
        case EngineError::IllegalMove: return "Illegal move";
        case EngineError::NoLegalMoves: return "No legal moves available";
        case EngineError::GameOver: return "Game is already over";
        case EngineError::NothingToUndo: return "Nothing to undo";
    }
    return "Unknown error";
}

template<typename T>
using Result = std::expected<T, EngineError>;

//===============================================================================
// UTILITY FUNCTIONS
//===============================================================================

constexpr Player other_player(Player player) noexcept {
    switch (player) {
        case Player::Black: return Player::White;
        case Player::White: return Player::Black;
        default: return Player::Empty;
    }
}

constexpr std::string_view player_to_string(Player player) noexcept {
    switch (player) {
        case Player::Black: return "black";
        case Player::White: return "white";
        default: return "empty";
    }
}

constexpr std::optional<Player> parse_player(std::string_view text) noexcept {
    if (text == "black" || text == "b") return Player::Black;
    if (text == "white" || text == "w") return Player::White;
    return std::nullopt;
}

constexpr std::string_view difficulty_to_string(Difficulty difficulty) noexcept {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
    }
    return "unknown";
}

constexpr std::optional<Difficulty> parse_difficulty(std::string_view text) noexcept {
    if (text == "easy") return Difficulty::Easy;
    if (text == "medium") return Difficulty::Medium;
    if (text == "hard") return Difficulty::Hard;
    return std::nullopt;
}

// Algebraic cell names: column letter a-h, row number 1-8 ("d3" is row 2, col 3)
[[nodiscard]] inline std::string to_notation(const Position& pos) {
    return std::format("{}{}", static_cast<char>('a' + pos.col), pos.row + 1);
}

[[nodiscard]] constexpr std::optional<Position> from_notation(std::string_view text) noexcept {
    if (text.size() != 2) {
        return std::nullopt;
    }
    char file = text[0];
    if (file >= 'A' && file <= 'Z') {
        file = static_cast<char>(file - 'A' + 'a');
    }
    Position pos{text[1] - '1', file - 'a'};
    if (!pos.is_valid()) {
        return std::nullopt;
    }
    return pos;
}

//===============================================================================
// TIMING UTILITIES
//===============================================================================

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::duration<double>;

inline TimePoint now() noexcept {
    return std::chrono::steady_clock::now();
}

inline double elapsed_seconds(TimePoint start, TimePoint end = now()) noexcept {
    return std::chrono::duration_cast<Duration>(end - start).count();
}

} // namespace othello

//===============================================================================
// HASH SUPPORT
//===============================================================================

template<>
struct std::hash<othello::Position> {
    std::size_t operator()(const othello::Position& pos) const noexcept {
        return std::hash<int>{}(pos.row) ^ (std::hash<int>{}(pos.col) << 1);
    }
};

template<>
struct std::formatter<othello::Position> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const othello::Position& pos, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "({}, {})", pos.row, pos.col);
    }
};

//
//  rules.hpp
//  othello - Move resolution, enumeration and game-over detection
//
//  Pure functions over immutable boards
//

#pragma once

#include <optional>
#include <vector>
#include "othello.hpp"
#include "board.hpp"

namespace othello {

//===============================================================================
// TYPES
//===============================================================================

/**
 * A legal move together with the discs it would flip.
 */
struct Move {
    Position pos;
    int flip_count = 0;
    std::vector<Position> flipped;

    bool operator==(const Move&) const = default;
};

using MoveList = std::vector<Move>;

//===============================================================================
// MOVE RESOLUTION
//===============================================================================

/**
 * Computes the opposing discs that placing a disc for player at pos would flip.
 *
 * Each of the eight directions is walked independently; a run of opposing
 * discs is kept only when it is closed off by one of player's own discs.
 * Returns an empty list for off-board or occupied targets.
 */
[[nodiscard]] std::vector<Position> flipped_discs(const Board& board, const Position& pos, Player player);

[[nodiscard]] bool is_legal_move(const Board& board, const Position& pos, Player player);

//===============================================================================
// MOVE ENUMERATION
//===============================================================================

/**
 * All legal moves for player in row-major order. An empty list means the
 * player has to pass.
 */
[[nodiscard]] MoveList legal_moves(const Board& board, Player player);

// Number of legal moves, without building the flip lists
[[nodiscard]] int mobility(const Board& board, Player player);

[[nodiscard]] bool has_legal_move(const Board& board, Player player);

//===============================================================================
// MOVE APPLICATION
//===============================================================================

/**
 * Places a disc for player at pos and flips the sandwiched discs.
 *
 * @return The new board, or EngineError::IllegalMove when the move flips nothing.
 *         The input board is never modified.
 */
[[nodiscard]] Result<Board> apply_move(const Board& board, const Position& pos, Player player);

//===============================================================================
// GAME END
//===============================================================================

// Full board, or neither side can move
[[nodiscard]] bool is_game_over(const Board& board);

// Side with strictly more discs; nullopt for a draw
[[nodiscard]] std::optional<Player> winner(const Board& board);

} // namespace othello

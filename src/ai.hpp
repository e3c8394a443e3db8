//
//  ai.hpp
//  othello - Computer opponent: random, greedy and minimax move selection
//

#pragma once

#include <random>
#include "othello.hpp"
#include "board.hpp"
#include "rules.hpp"

namespace othello {

//===============================================================================
// AI CONSTANTS
//===============================================================================

inline constexpr int SEARCH_DEPTH = 6;

// Terminal scores are offset by the remaining depth so quicker wins rank higher
inline constexpr int WIN_SCORE = 10'000;
inline constexpr int LOSS_SCORE = -WIN_SCORE;

namespace priority {
    inline constexpr int CORNER = 1000;
    inline constexpr int EDGE = 500;
    inline constexpr int X_SQUARE = -100;           // Only while its corner is empty
    inline constexpr int CENTER_BASE = 100;
    inline constexpr int CENTER_DISTANCE = 10;      // Per unit of Manhattan distance
}

static_assert(priority::CORNER > priority::EDGE);
static_assert(priority::EDGE > priority::CENTER_BASE);
static_assert(priority::X_SQUARE < 0);

//===============================================================================
// SEARCH STATISTICS
//===============================================================================

struct SearchStats {
    int depth = 0;              // Plies searched, 0 for the non-searching policies
    long nodes_visited = 0;
    long cutoffs = 0;
    int best_score = 0;         // Root score of the chosen move (minimax only)
};

//===============================================================================
// MOVE SELECTION
//===============================================================================

/**
 * Picks a move for player at the given difficulty.
 *
 * Easy samples uniformly, Medium applies the greedy heuristic and Hard runs a
 * fixed-depth alpha-beta search. Medium and Hard are deterministic.
 *
 * @return The chosen cell, or EngineError::NoLegalMoves if player must pass.
 */
[[nodiscard]] Result<Position> choose_move(const Board& board, Player player, Difficulty difficulty);

/**
 * Same as above with an explicit random source and optional search statistics.
 */
[[nodiscard]] Result<Position> choose_move(const Board& board, Player player, Difficulty difficulty,
                                           std::mt19937& rng, SearchStats* stats = nullptr);

// Uniform choice among moves; moves must not be empty
[[nodiscard]] Position random_move(const MoveList& moves, std::mt19937& rng);

/**
 * Corner first, then avoid X-squares next to empty corners, then the edge
 * move with the most flips, then the move with the most flips. Ties go to
 * the earlier move in moves.
 */
[[nodiscard]] Position greedy_move(const Board& board, const MoveList& moves);

/**
 * Root of the alpha-beta search. Children are searched in priority order and
 * the first move with the strictly highest score wins.
 *
 * @return The chosen cell, or EngineError::NoLegalMoves when moves is empty.
 */
[[nodiscard]] Result<Position> minimax_move(const Board& board, Player player, const MoveList& moves,
                                            int depth = SEARCH_DEPTH, SearchStats* stats = nullptr);

/**
 * Minimax with alpha-beta pruning, scored from ai_player's point of view.
 * A side without moves passes and the search continues one ply shallower.
 */
[[nodiscard]] int minimax(const Board& board, int depth, int alpha, int beta,
                          bool maximizing, Player ai_player, SearchStats* stats = nullptr);

//===============================================================================
// MOVE ORDERING
//===============================================================================

/**
 * Ordering priority: corners, then edges, then interior cells by closeness
 * to the centre, with X-squares next to an empty corner last.
 */
[[nodiscard]] int move_priority(const Board& board, const Position& pos);

// Stable sort by descending priority
[[nodiscard]] MoveList order_moves(const Board& board, MoveList moves);

} // namespace othello

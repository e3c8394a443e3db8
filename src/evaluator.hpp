//
//  evaluator.hpp
//  othello - Static position evaluation
//
//  Scores a board from one side's point of view: position first, then
//  mobility, then raw disc count.
//

#pragma once

#include "othello.hpp"
#include "board.hpp"

namespace othello {

//===============================================================================
// EVALUATION WEIGHTS
//===============================================================================

struct EvalWeights {
    int corner = 100;
    int x_square_penalty = 25;      // Diagonal neighbour of an empty corner
    int c_square_penalty = 20;      // Orthogonal neighbour of an empty corner
    int edge = 5;                   // Edge cells that are neither corners nor C-squares
    int mobility = 2;               // Per legal move of difference
    int disc = 1;                   // Per disc of difference

    /**
     * Corners dominate, X-squares hurt more than C-squares, C-squares more
     * than an edge is worth, and mobility outweighs material.
     */
    [[nodiscard]] constexpr bool is_well_ordered() const noexcept {
        return corner > x_square_penalty && x_square_penalty > c_square_penalty &&
               c_square_penalty > edge && mobility > disc && disc > 0;
    }
};

inline constexpr EvalWeights DEFAULT_WEIGHTS{};

static_assert(DEFAULT_WEIGHTS.is_well_ordered(), "evaluation weights out of order");

//===============================================================================
// EVALUATION FUNCTIONS
//===============================================================================

/**
 * Main evaluation function for the minimax search.
 *
 * Positive scores favour player. The score is antisymmetric:
 * evaluate_position(b, p) == -evaluate_position(b, other_player(p)).
 */
[[nodiscard]] int evaluate_position(const Board& board, Player player,
                                    const EvalWeights& weights = DEFAULT_WEIGHTS);

// Same score with both sides' legal move counts already known
[[nodiscard]] int evaluate_position(const Board& board, Player player,
                                    int player_mobility, int opponent_mobility,
                                    const EvalWeights& weights = DEFAULT_WEIGHTS);

} // namespace othello

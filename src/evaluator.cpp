//
//  evaluator.cpp
//  othello - Static position evaluation
//

#include "evaluator.hpp"
#include "board_positions.hpp"
#include "rules.hpp"

namespace othello {

namespace {

    // +1 for player's disc, -1 for the opponent's, 0 for an empty cell
    int ownership(const Board& board, const Position& pos, Player player) {
        const Player cell = board.at(pos);
        if (cell == Player::Empty) return 0;
        return cell == player ? 1 : -1;
    }

    int guarded_penalty(const Board& board, Player player, const GuardedSquare& gs, int penalty) {
        if (board.at(gs.corner) != Player::Empty) {
            return 0;
        }
        return -penalty * ownership(board, gs.square, player);
    }

} // namespace

int evaluate_position(const Board& board, Player player, const EvalWeights& weights) {
    return evaluate_position(board, player, mobility(board, player),
                             mobility(board, other_player(player)), weights);
}

int evaluate_position(const Board& board, Player player,
                      int player_mobility, int opponent_mobility, const EvalWeights& weights) {
    const Player opponent = other_player(player);
    int score = 0;

    for (const auto& corner : CORNERS) {
        score += weights.corner * ownership(board, corner, player);
    }

    for (const auto& xs : X_SQUARES) {
        score += guarded_penalty(board, player, xs, weights.x_square_penalty);
    }

    for (const auto& cs : C_SQUARES) {
        score += guarded_penalty(board, player, cs, weights.c_square_penalty);
    }

    // Edges, skipping corners and C-squares
    constexpr int last = BOARD_SIZE - 1;
    for (int i = 2; i < BOARD_SIZE - 2; ++i) {
        score += weights.edge * (ownership(board, {0, i}, player) +
                                 ownership(board, {last, i}, player) +
                                 ownership(board, {i, 0}, player) +
                                 ownership(board, {i, last}, player));
    }

    score += weights.mobility * (player_mobility - opponent_mobility);
    score += weights.disc * (board.disc_count(player) - board.disc_count(opponent));

    return score;
}

} // namespace othello

//
//  ai.cpp
//  othello - Computer opponent: random, greedy and minimax move selection
//

#include <algorithm>
#include <cstdlib>
#include <limits>
#include "ai.hpp"
#include "board_positions.hpp"
#include "evaluator.hpp"

namespace othello {

namespace {

    constexpr int INF_SCORE = std::numeric_limits<int>::max();

    std::mt19937& default_rng() {
        thread_local std::mt19937 rng{std::random_device{}()};
        return rng;
    }

    // First move with the most flips
    const Move& most_flips(const std::vector<const Move*>& candidates) {
        return **std::ranges::max_element(candidates, {}, [](const Move* m) { return m->flip_count; });
    }

    bool is_exposed_x_square(const Board& board, const Position& pos) {
        const auto corner = x_square_corner(pos);
        return corner && board.at(*corner) == Player::Empty;
    }

    int terminal_score(const Board& board, int depth, Player ai_player) {
        const auto won_by = winner(board);
        if (!won_by) return 0;
        return *won_by == ai_player ? WIN_SCORE + depth : LOSS_SCORE - depth;
    }

} // namespace

//===============================================================================
// MOVE SELECTION
//===============================================================================

Result<Position> choose_move(const Board& board, Player player, Difficulty difficulty) {
    return choose_move(board, player, difficulty, default_rng());
}

Result<Position> choose_move(const Board& board, Player player, Difficulty difficulty,
                             std::mt19937& rng, SearchStats* stats) {
    const MoveList moves = legal_moves(board, player);
    if (moves.empty()) {
        return std::unexpected(EngineError::NoLegalMoves);
    }

    if (stats) {
        *stats = SearchStats{};
        stats->nodes_visited = static_cast<long>(moves.size());
    }

    switch (difficulty) {
        case Difficulty::Easy:
            return random_move(moves, rng);
        case Difficulty::Medium:
            return greedy_move(board, moves);
        case Difficulty::Hard:
            return minimax_move(board, player, moves, SEARCH_DEPTH, stats);
    }
    return random_move(moves, rng);
}

Position random_move(const MoveList& moves, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
    return moves[pick(rng)].pos;
}

Position greedy_move(const Board& board, const MoveList& moves) {
    // 1. Corners can never be flipped back
    for (const auto& corner : CORNERS) {
        auto it = std::ranges::find(moves, corner, &Move::pos);
        if (it != moves.end()) {
            return it->pos;
        }
    }

    // 2. Stay off X-squares that hand a corner to the opponent
    std::vector<const Move*> candidates;
    for (const auto& move : moves) {
        if (!is_exposed_x_square(board, move.pos)) {
            candidates.push_back(&move);
        }
    }
    if (candidates.empty()) {
        for (const auto& move : moves) {
            candidates.push_back(&move);
        }
    }

    // 3. Edges are hard to flip
    std::vector<const Move*> edges;
    for (const Move* move : candidates) {
        if (is_edge(move->pos) && !is_corner(move->pos)) {
            edges.push_back(move);
        }
    }
    if (!edges.empty()) {
        return most_flips(edges).pos;
    }

    // 4. Otherwise flip as much as possible
    return most_flips(candidates).pos;
}

Result<Position> minimax_move(const Board& board, Player player, const MoveList& moves,
                              int depth, SearchStats* stats) {
    if (moves.empty()) {
        return std::unexpected(EngineError::NoLegalMoves);
    }

    if (stats) {
        stats->depth = depth;
        stats->nodes_visited = 0;
        stats->cutoffs = 0;
    }

    const MoveList ordered = order_moves(board, moves);
    Position best_move = ordered.front().pos;
    int best_score = -INF_SCORE;

    for (const auto& move : ordered) {
        const Board child = board.with_move(move.pos, move.flipped, player);
        // A child that fails low returns a bound no better than best_score,
        // so narrowing alpha here cannot change which move is selected
        const int score = minimax(child, depth - 1, best_score, INF_SCORE, false, player, stats);
        if (score > best_score) {
            best_score = score;
            best_move = move.pos;
        }
    }

    if (stats) {
        stats->best_score = best_score;
    }
    return best_move;
}

int minimax(const Board& board, int depth, int alpha, int beta,
            bool maximizing, Player ai_player, SearchStats* stats) {
    if (stats) {
        ++stats->nodes_visited;
    }

    const Player side = maximizing ? ai_player : other_player(ai_player);
    const Player opponent = other_player(side);

    // A full board leaves neither side a move, so both terminal cases
    // reduce to two empty move counts
    if (depth <= 0) {
        const int side_mobility = mobility(board, side);
        const int opponent_mobility = mobility(board, opponent);
        if (side_mobility == 0 && opponent_mobility == 0) {
            return terminal_score(board, depth, ai_player);
        }
        return maximizing
            ? evaluate_position(board, ai_player, side_mobility, opponent_mobility)
            : evaluate_position(board, ai_player, opponent_mobility, side_mobility);
    }

    MoveList moves = legal_moves(board, side);

    if (moves.empty()) {
        if (!has_legal_move(board, opponent)) {
            return terminal_score(board, depth, ai_player);
        }
        // Forced pass
        return minimax(board, depth - 1, alpha, beta, !maximizing, ai_player, stats);
    }

    moves = order_moves(board, std::move(moves));

    int best = maximizing ? -INF_SCORE : INF_SCORE;
    for (const auto& move : moves) {
        const Board child = board.with_move(move.pos, move.flipped, side);
        const int score = minimax(child, depth - 1, alpha, beta, !maximizing, ai_player, stats);

        if (maximizing) {
            best = std::max(best, score);
            alpha = std::max(alpha, score);
        } else {
            best = std::min(best, score);
            beta = std::min(beta, score);
        }

        if (beta <= alpha) {
            if (stats) ++stats->cutoffs;
            break;
        }
    }

    return best;
}

//===============================================================================
// MOVE ORDERING
//===============================================================================

int move_priority(const Board& board, const Position& pos) {
    if (is_corner(pos)) {
        return priority::CORNER;
    }
    if (is_edge(pos)) {
        return priority::EDGE;
    }
    if (is_exposed_x_square(board, pos)) {
        return priority::X_SQUARE;
    }

    // Manhattan distance to the geometric centre, counted in half cells
    // because the centre of an even board falls between four cells
    constexpr int span = BOARD_SIZE - 1;
    const int half_distance = std::abs(2 * pos.row - span) + std::abs(2 * pos.col - span);
    return priority::CENTER_BASE - half_distance * priority::CENTER_DISTANCE / 2;
}

MoveList order_moves(const Board& board, MoveList moves) {
    std::ranges::stable_sort(moves, std::ranges::greater{},
                             [&board](const Move& m) { return move_priority(board, m.pos); });
    return moves;
}

} // namespace othello

//
//  ai_test.cpp
//  othello tests - Evaluation, move ordering and the three AI policies
//

#include <gtest/gtest.h>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "othello.hpp"
#include "board.hpp"
#include "rules.hpp"
#include "evaluator.hpp"
#include "ai.hpp"

using namespace othello;

namespace {

    Board board_from(const std::vector<std::string>& rows) {
        auto board = Board::parse(rows);
        EXPECT_TRUE(board.has_value()) << (board ? "" : board.error());
        return board.value_or(Board{});
    }

    Board single_disc(const Position& pos, Player player) {
        return Board{}.with(pos, player);
    }

    Move candidate(int row, int col, int flips) {
        return Move{{row, col}, flips, {}};
    }

    bool contains(const MoveList& moves, const Position& pos) {
        for (const auto& move : moves) {
            if (move.pos == pos) return true;
        }
        return false;
    }

    // Black's (0,3) takes every white disc; (1,3) flips a single one
    const std::vector<std::string> WINNING_ROWS = {
        "BWW.....",
        ".BW.....",
        ".B......",
        "........",
        "........",
        "........",
        "........",
        "........",
    };

} // namespace

//===============================================================================
// EVALUATION
//===============================================================================

TEST(EvaluatorTest, WeightsAreWellOrdered) {
    EXPECT_TRUE(DEFAULT_WEIGHTS.is_well_ordered());

    EvalWeights flat;
    flat.x_square_penalty = flat.c_square_penalty;
    EXPECT_FALSE(flat.is_well_ordered());
}

TEST(EvaluatorTest, InitialPositionIsBalanced) {
    EXPECT_EQ(evaluate_position(Board::initial(), Player::Black), 0);
    EXPECT_EQ(evaluate_position(Board::initial(), Player::White), 0);
}

TEST(EvaluatorTest, ScoresAreAntisymmetric) {
    const Board board = board_from({
        "B.W.....",
        ".WB.....",
        "..BBW...",
        "...WB...",
        "..WBBB..",
        "........",
        "......W.",
        ".......B",
    });
    EXPECT_EQ(evaluate_position(board, Player::Black), -evaluate_position(board, Player::White));
}

TEST(EvaluatorTest, CornerIsWorthMost) {
    // Corner plus one disc of material
    EXPECT_EQ(evaluate_position(single_disc({0, 0}, Player::Black), Player::Black), 101);
    EXPECT_EQ(evaluate_position(single_disc({7, 7}, Player::White), Player::Black), -101);
}

TEST(EvaluatorTest, SquaresNextToEmptyCornersArePenalized) {
    EXPECT_EQ(evaluate_position(single_disc({1, 1}, Player::Black), Player::Black), -24);
    EXPECT_EQ(evaluate_position(single_disc({0, 1}, Player::Black), Player::Black), -19);
    EXPECT_EQ(evaluate_position(single_disc({6, 7}, Player::Black), Player::Black), -19);

    // Once the corner is taken the X-square is an ordinary interior cell
    const Board guarded = single_disc({0, 0}, Player::Black).with({1, 1}, Player::Black);
    EXPECT_EQ(evaluate_position(guarded, Player::Black), 102);
}

TEST(EvaluatorTest, EdgesAndCustomWeights) {
    const Board board = single_disc({0, 3}, Player::Black);
    EXPECT_EQ(evaluate_position(board, Player::Black), 6);

    EvalWeights weights;
    weights.disc = 3;
    EXPECT_EQ(evaluate_position(board, Player::Black, weights), 8);
}

TEST(EvaluatorTest, MobilityCounts) {
    const Board board = board_from(WINNING_ROWS);
    ASSERT_EQ(mobility(board, Player::Black), 2);
    ASSERT_EQ(mobility(board, Player::White), 4);

    // Corner 100, its X- and C-squares no longer count, white edge disc on
    // (0,2) -5, mobility 2 * (2 - 4), discs level
    EXPECT_EQ(evaluate_position(board, Player::Black), 100 - 5 - 4);
}

//===============================================================================
// MOVE ORDERING
//===============================================================================

TEST(OrderingTest, Priorities) {
    const Board empty;
    EXPECT_EQ(move_priority(empty, {0, 0}), priority::CORNER);
    EXPECT_EQ(move_priority(empty, {0, 3}), priority::EDGE);
    EXPECT_EQ(move_priority(empty, {0, 1}), priority::EDGE);
    EXPECT_EQ(move_priority(empty, {1, 1}), priority::X_SQUARE);
    EXPECT_EQ(move_priority(empty, {3, 3}), 90);
    EXPECT_EQ(move_priority(empty, {4, 4}), 90);
    EXPECT_EQ(move_priority(empty, {2, 3}), 80);

    // An X-square next to an occupied corner ranks by its distance instead
    const Board taken = single_disc({0, 0}, Player::White);
    EXPECT_EQ(move_priority(taken, {1, 1}), 50);
}

TEST(OrderingTest, SortsByPriorityAndKeepsTies) {
    const Board empty;
    const MoveList moves = {candidate(3, 3, 1), candidate(1, 1, 1), candidate(0, 3, 1),
                            candidate(4, 4, 1), candidate(0, 0, 1)};

    const MoveList ordered = order_moves(empty, moves);
    ASSERT_EQ(ordered.size(), moves.size());
    EXPECT_EQ(ordered[0].pos, (Position{0, 0}));
    EXPECT_EQ(ordered[1].pos, (Position{0, 3}));
    EXPECT_EQ(ordered[2].pos, (Position{3, 3}));
    EXPECT_EQ(ordered[3].pos, (Position{4, 4}));
    EXPECT_EQ(ordered[4].pos, (Position{1, 1}));

    // Equal priorities keep their original order
    const MoveList opening = legal_moves(Board::initial(), Player::Black);
    EXPECT_EQ(order_moves(Board::initial(), opening), opening);
}

//===============================================================================
// GREEDY POLICY
//===============================================================================

TEST(GreedyTest, TakesFirstCornerInFixedOrder) {
    const MoveList moves = {candidate(2, 2, 5), candidate(7, 7, 1), candidate(0, 0, 1)};
    EXPECT_EQ(greedy_move(Board{}, moves), (Position{0, 0}));
}

TEST(GreedyTest, PrefersEdgeWithMostFlips) {
    const MoveList moves = {candidate(3, 3, 6), candidate(0, 3, 1), candidate(0, 4, 2)};
    EXPECT_EQ(greedy_move(Board{}, moves), (Position{0, 4}));

    const MoveList tied = {candidate(3, 3, 6), candidate(7, 3, 2), candidate(0, 4, 2)};
    EXPECT_EQ(greedy_move(Board{}, tied), (Position{7, 3}));
}

TEST(GreedyTest, OtherwiseMostFlipsFirstOnTies) {
    const MoveList moves = {candidate(2, 2, 1), candidate(3, 3, 4), candidate(4, 4, 4)};
    EXPECT_EQ(greedy_move(Board{}, moves), (Position{3, 3}));
}

TEST(GreedyTest, AvoidsExposedXSquares) {
    const MoveList moves = {candidate(1, 1, 10), candidate(3, 3, 1)};
    EXPECT_EQ(greedy_move(Board{}, moves), (Position{3, 3}));

    // Corner already taken: the X-square is safe again
    EXPECT_EQ(greedy_move(single_disc({0, 0}, Player::Black), moves), (Position{1, 1}));
}

TEST(GreedyTest, FallsBackWhenOnlyXSquaresRemain) {
    const MoveList moves = {candidate(1, 1, 3), candidate(6, 6, 5)};
    EXPECT_EQ(greedy_move(Board{}, moves), (Position{6, 6}));
}

TEST(GreedyTest, MediumPlaysRealPosition) {
    const Board board = board_from({
        ".....BW.",
        "........",
        "........",
        "..BWW...",
        "........",
        "........",
        "........",
        "........",
    });
    auto choice = choose_move(board, Player::Black, Difficulty::Medium);
    ASSERT_TRUE(choice.has_value());
    EXPECT_EQ(*choice, (Position{0, 7}));
}

//===============================================================================
// RANDOM POLICY
//===============================================================================

TEST(RandomTest, EasyPicksVariedLegalMoves) {
    const Board board = Board::initial();
    const MoveList moves = legal_moves(board, Player::Black);
    std::mt19937 rng(42);

    std::set<Position> seen;
    for (int i = 0; i < 30; ++i) {
        auto choice = choose_move(board, Player::Black, Difficulty::Easy, rng);
        ASSERT_TRUE(choice.has_value());
        EXPECT_TRUE(contains(moves, *choice));
        seen.insert(*choice);
    }
    EXPECT_GT(seen.size(), 1u);
}

TEST(RandomTest, SameSeedSameChoices) {
    const MoveList moves = legal_moves(Board::initial(), Player::White);
    std::mt19937 first(1234);
    std::mt19937 second(1234);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(random_move(moves, first), random_move(moves, second));
    }
}

//===============================================================================
// MINIMAX
//===============================================================================

TEST(MinimaxTest, TakesImmediateWin) {
    const Board board = board_from(WINNING_ROWS);
    std::mt19937 rng(0);
    SearchStats stats;

    auto choice = choose_move(board, Player::Black, Difficulty::Hard, rng, &stats);
    ASSERT_TRUE(choice.has_value());
    EXPECT_EQ(*choice, (Position{0, 3}));
    EXPECT_EQ(stats.depth, SEARCH_DEPTH);
    // Terminal score carries the depth left below the root
    EXPECT_EQ(stats.best_score, WIN_SCORE + SEARCH_DEPTH - 1);
    EXPECT_GT(stats.nodes_visited, 0);
}

TEST(MinimaxTest, ScoresTerminalPositions) {
    const Board white_only = single_disc({3, 3}, Player::White);
    EXPECT_EQ(minimax(white_only, 3, -100000, 100000, true, Player::Black), LOSS_SCORE - 3);
    EXPECT_EQ(minimax(white_only, 3, -100000, 100000, false, Player::White), WIN_SCORE + 3);

    const Board full_draw = board_from({
        "BBBBBBBB", "WWWWWWWW", "BBBBBBBB", "WWWWWWWW",
        "BBBBBBBB", "WWWWWWWW", "BBBBBBBB", "WWWWWWWW",
    });
    EXPECT_EQ(minimax(full_draw, 2, -100000, 100000, true, Player::Black), 0);
}

TEST(EvaluatorTest, KnownMobilityMatchesCounted) {
    const Board board = board_from(WINNING_ROWS);
    EXPECT_EQ(evaluate_position(board, Player::Black,
                                mobility(board, Player::Black), mobility(board, Player::White)),
              evaluate_position(board, Player::Black));
    EXPECT_EQ(evaluate_position(board, Player::White, 4, 2),
              evaluate_position(board, Player::White));
}

TEST(MinimaxTest, LeafUsesEvaluator) {
    const Board board = Board::initial();
    EXPECT_EQ(minimax(board, 0, -100000, 100000, true, Player::Black),
              evaluate_position(board, Player::Black));
}

TEST(MinimaxTest, HardIsDeterministic) {
    const Board board = Board::initial();
    std::mt19937 rng_a(1);
    std::mt19937 rng_b(99);
    SearchStats stats;

    auto first = choose_move(board, Player::Black, Difficulty::Hard, rng_a, &stats);
    auto second = choose_move(board, Player::Black, Difficulty::Hard, rng_b);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_TRUE(contains(legal_moves(board, Player::Black), *first));
    EXPECT_GT(stats.nodes_visited, 4);
    EXPECT_GT(stats.cutoffs, 0);
}

TEST(MinimaxTest, SearchesThroughForcedPass) {
    // After (0,2) white must pass; depth 2 still sees black's second capture
    const Board board = board_from({
        "BW......", "........", "........", "........",
        "........", "........", "........", "BW......",
    });
    const MoveList moves = legal_moves(board, Player::Black);
    SearchStats stats;
    auto choice = minimax_move(board, Player::Black, moves, 2, &stats);
    ASSERT_TRUE(choice.has_value());
    EXPECT_TRUE(contains(moves, *choice));
    EXPECT_GT(stats.best_score, 0);
}

TEST(MinimaxTest, RootWithoutMovesReportsError) {
    const Board board = single_disc({3, 3}, Player::Black);
    SearchStats stats;
    auto choice = minimax_move(board, Player::White, {}, SEARCH_DEPTH, &stats);
    ASSERT_FALSE(choice.has_value());
    EXPECT_EQ(choice.error(), EngineError::NoLegalMoves);
}

TEST(MinimaxTest, LeafScoresFromEitherSideToMove) {
    const Board board = board_from(WINNING_ROWS);
    const int expected = evaluate_position(board, Player::Black);
    EXPECT_EQ(minimax(board, 0, -100000, 100000, true, Player::Black), expected);
    EXPECT_EQ(minimax(board, 0, -100000, 100000, false, Player::Black), expected);
    EXPECT_EQ(minimax(board, 0, -100000, 100000, false, Player::White), -expected);
}

TEST(MinimaxTest, CornerBeatsInteriorMoves) {
    // (0,0) flips both white discs; (1,2) and (2,0) flip one each
    const Board board = board_from({
        ".WB.....",
        "BW......",
        "..B.....",
        "........",
        "........",
        "........",
        "........",
        "........",
    });
    const MoveList moves = legal_moves(board, Player::Black);
    ASSERT_EQ(moves.size(), 3u);
    ASSERT_TRUE(contains(moves, {1, 2}));

    EXPECT_EQ(greedy_move(board, moves), (Position{0, 0}));

    auto hard = choose_move(board, Player::Black, Difficulty::Hard);
    ASSERT_TRUE(hard.has_value());
    EXPECT_EQ(*hard, (Position{0, 0}));
}

//===============================================================================
// MOVE SELECTION
//===============================================================================

TEST(ChooseMoveTest, NoLegalMoves) {
    const Board board = single_disc({3, 3}, Player::Black);
    for (auto difficulty : {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard}) {
        auto choice = choose_move(board, Player::White, difficulty);
        ASSERT_FALSE(choice.has_value());
        EXPECT_EQ(choice.error(), EngineError::NoLegalMoves);
    }
}

TEST(ChooseMoveTest, NonSearchingPoliciesReportCandidates) {
    std::mt19937 rng(5);
    SearchStats stats;
    stats.depth = 9;

    auto choice = choose_move(Board::initial(), Player::White, Difficulty::Medium, rng, &stats);
    ASSERT_TRUE(choice.has_value());
    EXPECT_EQ(stats.depth, 0);
    EXPECT_EQ(stats.nodes_visited, 4);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

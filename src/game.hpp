//
//  game.hpp
//  othello - Turn sequencing, pass and terminal detection, move history
//
//  GameState is a plain value owned by the host; every transition returns a
//  fresh state and leaves the input untouched.
//

#pragma once

#include <optional>
#include <vector>
#include "othello.hpp"
#include "board.hpp"
#include "rules.hpp"

namespace othello {

//===============================================================================
// GAME STATE STRUCTURES
//===============================================================================

/**
 * One entry of the move history
 */
struct MoveRecord {
    Position pos;
    Player player = Player::Empty;
    int flip_count = 0;

    bool operator==(const MoveRecord&) const = default;
};

/**
 * Complete state of a game in progress or finished
 */
struct GameState {
    Board board = Board::initial();
    Player current_player = Player::Black;
    GameStatus status = GameStatus::Playing;
    std::optional<Player> winner;            // Set only when status is Won

    GameMode mode = GameMode::PlayerVsComputer;
    Difficulty difficulty = Difficulty::Medium;

    std::vector<MoveRecord> move_history;
    std::optional<Position> last_move;

    // Legal moves of current_player; empty once the game is over
    MoveList legal_moves;

    // True when the last move left the opponent without a reply and the
    // mover keeps the turn
    bool passed = false;

    // Position the history is replayed from by undo
    Board start_board = Board::initial();
    Player start_player = Player::Black;

    [[nodiscard]] int black_count() const noexcept { return board.disc_count(Player::Black); }
    [[nodiscard]] int white_count() const noexcept { return board.disc_count(Player::White); }
    [[nodiscard]] bool is_over() const noexcept { return status != GameStatus::Playing; }
};

//===============================================================================
// GAME LIFECYCLE
//===============================================================================

/**
 * Starts a game from the standard four-disc position with black to move.
 */
[[nodiscard]] GameState new_game(GameMode mode = GameMode::PlayerVsComputer,
                                 Difficulty difficulty = Difficulty::Medium);

/**
 * Picks up an arbitrary position with side to move and no history. The
 * status and winner are derived from the board, so a finished position
 * yields a finished state. If side has no legal move on an unfinished board
 * the turn passes to the opponent and passed is set.
 */
[[nodiscard]] GameState resume_game(const Board& board, Player side,
                                    GameMode mode = GameMode::PlayerVsComputer,
                                    Difficulty difficulty = Difficulty::Medium);

/**
 * Plays pos for the side to move and hands the turn on.
 *
 * The opponent moves next when it has a legal move; otherwise the mover keeps
 * the turn when it still has one; otherwise the game ends. A full board ends
 * the game regardless.
 *
 * @return The next state, EngineError::GameOver if the game has already
 *         finished, or EngineError::IllegalMove if pos flips nothing.
 */
[[nodiscard]] Result<GameState> advance_turn(const GameState& state, const Position& pos);

//===============================================================================
// UNDO
//===============================================================================

[[nodiscard]] bool can_undo(const GameState& state, int moves = 1) noexcept;

/**
 * Takes back the last n moves by replaying the rest of the history from the
 * position the game started at (start_board, start_player). Mode and
 * difficulty are preserved.
 *
 * @return The rebuilt state, or EngineError::NothingToUndo when fewer than n
 *         moves have been played.
 */
[[nodiscard]] Result<GameState> undo_moves(const GameState& state, int moves = 1);

} // namespace othello

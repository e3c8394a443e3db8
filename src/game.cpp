//
//  game.cpp
//  othello - Turn sequencing, pass and terminal detection, move history
//

#include "game.hpp"

namespace othello {

GameState new_game(GameMode mode, Difficulty difficulty) {
    GameState state;
    state.mode = mode;
    state.difficulty = difficulty;
    state.legal_moves = legal_moves(state.board, state.current_player);
    return state;
}

GameState resume_game(const Board& board, Player side, GameMode mode, Difficulty difficulty) {
    GameState state;
    state.board = board;
    state.current_player = side;
    state.mode = mode;
    state.difficulty = difficulty;
    state.start_board = board;
    state.start_player = side;

    if (is_game_over(board)) {
        state.winner = winner(board);
        state.status = state.winner ? GameStatus::Won : GameStatus::Draw;
        return state;
    }

    state.legal_moves = legal_moves(board, side);
    if (state.legal_moves.empty()) {
        state.current_player = other_player(side);
        state.legal_moves = legal_moves(board, state.current_player);
        state.passed = true;
    }
    return state;
}

Result<GameState> advance_turn(const GameState& state, const Position& pos) {
    if (state.is_over()) {
        return std::unexpected(EngineError::GameOver);
    }

    const Player mover = state.current_player;
    const auto flipped = flipped_discs(state.board, pos, mover);
    if (flipped.empty()) {
        return std::unexpected(EngineError::IllegalMove);
    }

    GameState next = state;
    next.board = state.board.with_move(pos, flipped, mover);
    next.move_history.push_back({pos, mover, static_cast<int>(flipped.size())});
    next.last_move = pos;
    next.passed = false;

    const Player opponent = other_player(mover);
    if (is_game_over(next.board)) {
        next.winner = winner(next.board);
        next.status = next.winner ? GameStatus::Won : GameStatus::Draw;
        next.current_player = mover;
        next.legal_moves.clear();
        return next;
    }

    // Not over, so at least one side can move
    if (has_legal_move(next.board, opponent)) {
        next.current_player = opponent;
    } else {
        next.current_player = mover;
        next.passed = true;
    }
    next.legal_moves = legal_moves(next.board, next.current_player);

    return next;
}

bool can_undo(const GameState& state, int moves) noexcept {
    return moves > 0 && state.move_history.size() >= static_cast<size_t>(moves);
}

Result<GameState> undo_moves(const GameState& state, int moves) {
    if (!can_undo(state, moves)) {
        return std::unexpected(EngineError::NothingToUndo);
    }

    GameState replay = resume_game(state.start_board, state.start_player,
                                   state.mode, state.difficulty);
    const size_t keep = state.move_history.size() - static_cast<size_t>(moves);

    for (size_t i = 0; i < keep; ++i) {
        auto next = advance_turn(replay, state.move_history[i].pos);
        if (!next) {
            return std::unexpected(next.error());
        }
        replay = std::move(*next);
    }

    return replay;
}

} // namespace othello

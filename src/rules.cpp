//
//  rules.cpp
//  othello - Move resolution, enumeration and game-over detection
//

#include "rules.hpp"

namespace othello {

namespace {

    // Length of the run of opponent discs starting next to pos in direction dir,
    // or 0 when the run is not closed by one of player's discs
    int bracketed_run(const Board& board, const Position& pos, const Position& dir, Player player) {
        const Player opponent = other_player(player);
        int run = 0;

        Position cur = pos + dir;
        while (board.is_valid_position(cur) && board.at(cur) == opponent) {
            ++run;
            cur = cur + dir;
        }

        if (run > 0 && board.is_valid_position(cur) && board.at(cur) == player) {
            return run;
        }
        return 0;
    }

    bool can_place(const Board& board, const Position& pos, Player player) {
        return player != Player::Empty && board.is_empty_at(pos);
    }

} // namespace

//===============================================================================
// MOVE RESOLUTION
//===============================================================================

std::vector<Position> flipped_discs(const Board& board, const Position& pos, Player player) {
    std::vector<Position> flipped;
    if (!can_place(board, pos, player)) {
        return flipped;
    }

    for (const auto& dir : DIRECTIONS) {
        const int run = bracketed_run(board, pos, dir, player);
        for (int i = 1; i <= run; ++i) {
            flipped.push_back(pos + dir * i);
        }
    }

    return flipped;
}

bool is_legal_move(const Board& board, const Position& pos, Player player) {
    if (!can_place(board, pos, player)) {
        return false;
    }
    for (const auto& dir : DIRECTIONS) {
        if (bracketed_run(board, pos, dir, player) > 0) {
            return true;
        }
    }
    return false;
}

//===============================================================================
// MOVE ENUMERATION
//===============================================================================

MoveList legal_moves(const Board& board, Player player) {
    MoveList moves;

    for (int row = 0; row < Board::size; ++row) {
        for (int col = 0; col < Board::size; ++col) {
            auto flipped = flipped_discs(board, {row, col}, player);
            if (!flipped.empty()) {
                const int count = static_cast<int>(flipped.size());
                moves.push_back({{row, col}, count, std::move(flipped)});
            }
        }
    }

    return moves;
}

int mobility(const Board& board, Player player) {
    int count = 0;
    for (int row = 0; row < Board::size; ++row) {
        for (int col = 0; col < Board::size; ++col) {
            if (is_legal_move(board, {row, col}, player)) {
                ++count;
            }
        }
    }
    return count;
}

bool has_legal_move(const Board& board, Player player) {
    for (int row = 0; row < Board::size; ++row) {
        for (int col = 0; col < Board::size; ++col) {
            if (is_legal_move(board, {row, col}, player)) {
                return true;
            }
        }
    }
    return false;
}

//===============================================================================
// MOVE APPLICATION
//===============================================================================

Result<Board> apply_move(const Board& board, const Position& pos, Player player) {
    const auto flipped = flipped_discs(board, pos, player);
    if (flipped.empty()) {
        return std::unexpected(EngineError::IllegalMove);
    }
    return board.with_move(pos, flipped, player);
}

//===============================================================================
// GAME END
//===============================================================================

bool is_game_over(const Board& board) {
    if (board.is_full()) {
        return true;
    }
    return !has_legal_move(board, Player::Black) && !has_legal_move(board, Player::White);
}

std::optional<Player> winner(const Board& board) {
    const int black = board.disc_count(Player::Black);
    const int white = board.disc_count(Player::White);

    if (black > white) return Player::Black;
    if (white > black) return Player::White;
    return std::nullopt;
}

} // namespace othello

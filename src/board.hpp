//
//  board.hpp
//  othello - Modern C++23 Board Value Type
//
//  Immutable 8x8 grid: every change produces a new Board
//

#pragma once

#include "othello.hpp"
#include <array>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace othello {

//===============================================================================
// BOARD CLASS
//===============================================================================

class Board {
public:
    static constexpr int size = BOARD_SIZE;
    static constexpr int total_cells = BOARD_SIZE * BOARD_SIZE;

    using BoardData = std::array<std::array<Player, BOARD_SIZE>, BOARD_SIZE>;

private:
    BoardData board_{};
    int black_count_ = 0;
    int white_count_ = 0;

public:
    //===============================================================================
    // CONSTRUCTION
    //===============================================================================

    // Empty board
    constexpr Board() noexcept = default;

    /**
     * Standard starting position: white on d4/e5, black on e4/d5.
     */
    [[nodiscard]] static constexpr Board initial() noexcept {
        constexpr int mid = BOARD_SIZE / 2;
        Board board;
        board.set({mid - 1, mid - 1}, Player::White);
        board.set({mid - 1, mid}, Player::Black);
        board.set({mid, mid - 1}, Player::Black);
        board.set({mid, mid}, Player::White);
        return board;
    }

    /**
     * Builds a board from 8 rows of 8 characters: '.' empty, 'B'/'X' black,
     * 'W'/'O' white. Returns a description of the first problem on failure.
     */
    [[nodiscard]] static std::expected<Board, std::string> parse(const std::vector<std::string>& rows);

    Board(const Board&) = default;
    Board(Board&&) noexcept = default;
    Board& operator=(const Board&) = default;
    Board& operator=(Board&&) noexcept = default;
    ~Board() = default;

    //===============================================================================
    // BOARD ACCESS
    //===============================================================================

    [[nodiscard]] constexpr Player at(const Position& pos) const noexcept {
        return board_[pos.row][pos.col];
    }

    [[nodiscard]] constexpr Player at(int row, int col) const noexcept {
        return board_[row][col];
    }

    [[nodiscard]] constexpr bool is_valid_position(const Position& pos) const noexcept {
        return pos.is_valid(size);
    }

    [[nodiscard]] constexpr bool is_empty_at(const Position& pos) const noexcept {
        return is_valid_position(pos) && at(pos) == Player::Empty;
    }

    //===============================================================================
    // DERIVED BOARDS
    //===============================================================================

    // Copy of this board with a single cell changed
    [[nodiscard]] constexpr Board with(const Position& pos, Player player) const noexcept {
        Board next = *this;
        next.set(pos, player);
        return next;
    }

    // Copy of this board with a disc placed at pos and every cell in flips turned to player
    [[nodiscard]] constexpr Board with_move(const Position& pos, std::span<const Position> flips,
                                            Player player) const noexcept {
        Board next = *this;
        next.set(pos, player);
        for (const auto& flip : flips) {
            next.set(flip, player);
        }
        return next;
    }

    //===============================================================================
    // COUNTS
    //===============================================================================

    [[nodiscard]] constexpr int disc_count(Player player) const noexcept {
        switch (player) {
            case Player::Black: return black_count_;
            case Player::White: return white_count_;
            default: return empty_count();
        }
    }

    [[nodiscard]] constexpr int disc_count() const noexcept {
        return black_count_ + white_count_;
    }

    [[nodiscard]] constexpr int empty_count() const noexcept {
        return total_cells - disc_count();
    }

    [[nodiscard]] constexpr bool is_empty() const noexcept {
        return disc_count() == 0;
    }

    [[nodiscard]] constexpr bool is_full() const noexcept {
        return disc_count() == total_cells;
    }

    //===============================================================================
    // STRING REPRESENTATION
    //===============================================================================

    // One string per row, in the format accepted by parse()
    [[nodiscard]] std::vector<std::string> to_rows() const;

    [[nodiscard]] std::string to_string() const;

    //===============================================================================
    // COMPARISON OPERATORS
    //===============================================================================

    constexpr bool operator==(const Board& other) const noexcept = default;

    //===============================================================================
    // DEBUGGING SUPPORT
    //===============================================================================

    struct Statistics {
        int black_count = 0;
        int white_count = 0;
        int empty_count = 0;
        double fill_ratio = 0.0;
    };

    [[nodiscard]] Statistics get_statistics() const noexcept {
        return {black_count_, white_count_, empty_count(),
                static_cast<double>(disc_count()) / total_cells};
    }

private:
    constexpr void set(const Position& pos, Player player) noexcept {
        adjust_count(board_[pos.row][pos.col], -1);
        adjust_count(player, +1);
        board_[pos.row][pos.col] = player;
    }

    constexpr void adjust_count(Player player, int delta) noexcept {
        if (player == Player::Black) {
            black_count_ += delta;
        } else if (player == Player::White) {
            white_count_ += delta;
        }
    }
};

//===============================================================================
// CELL CHARACTERS
//===============================================================================

[[nodiscard]] constexpr char player_to_char(Player player) noexcept {
    switch (player) {
        case Player::Black: return 'B';
        case Player::White: return 'W';
        default: return '.';
    }
}

[[nodiscard]] constexpr std::optional<Player> char_to_player(char c) noexcept {
    switch (c) {
        case '.': case '-': return Player::Empty;
        case 'B': case 'b': case 'X': case 'x': return Player::Black;
        case 'W': case 'w': case 'O': case 'o': return Player::White;
        default: return std::nullopt;
    }
}

} // namespace othello

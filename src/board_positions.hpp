//
//  board_positions.hpp
//  othello - Strategic board regions used by the evaluator and the AI
//
//  Every table is derived from the board size at compile time
//

#pragma once

#include <array>
#include <optional>
#include "othello.hpp"

namespace othello {

/**
 * A square whose value depends on whether its neighbouring corner is taken.
 */
struct GuardedSquare {
    Position square;
    Position corner;
};

namespace detail {

    constexpr std::array<Position, 4> make_corners(int size) noexcept {
        const int last = size - 1;
        return {{{0, 0}, {0, last}, {last, 0}, {last, last}}};
    }

    // Step from a corner towards the board interior
    constexpr Position inward(const Position& corner) noexcept {
        return {corner.row == 0 ? 1 : -1, corner.col == 0 ? 1 : -1};
    }

    constexpr std::array<GuardedSquare, 4> make_x_squares(int size) noexcept {
        std::array<GuardedSquare, 4> result{};
        const auto corners = make_corners(size);
        for (std::size_t i = 0; i < corners.size(); ++i) {
            const Position step = inward(corners[i]);
            result[i] = {corners[i] + step, corners[i]};
        }
        return result;
    }

    constexpr std::array<GuardedSquare, 8> make_c_squares(int size) noexcept {
        std::array<GuardedSquare, 8> result{};
        const auto corners = make_corners(size);
        for (std::size_t i = 0; i < corners.size(); ++i) {
            const Position step = inward(corners[i]);
            result[2 * i] = {corners[i] + Position{0, step.col}, corners[i]};
            result[2 * i + 1] = {corners[i] + Position{step.row, 0}, corners[i]};
        }
        return result;
    }

} // namespace detail

// Corner enumeration order is fixed: top-left, top-right, bottom-left, bottom-right
inline constexpr auto CORNERS = detail::make_corners(BOARD_SIZE);
inline constexpr auto X_SQUARES = detail::make_x_squares(BOARD_SIZE);
inline constexpr auto C_SQUARES = detail::make_c_squares(BOARD_SIZE);

[[nodiscard]] constexpr bool is_corner(const Position& pos, int size = BOARD_SIZE) noexcept {
    const int last = size - 1;
    return (pos.row == 0 || pos.row == last) && (pos.col == 0 || pos.col == last);
}

// Boundary row or column, corners included
[[nodiscard]] constexpr bool is_edge(const Position& pos, int size = BOARD_SIZE) noexcept {
    const int last = size - 1;
    return pos.row == 0 || pos.row == last || pos.col == 0 || pos.col == last;
}

[[nodiscard]] constexpr bool is_c_square(const Position& pos) noexcept {
    for (const auto& cs : C_SQUARES) {
        if (cs.square == pos) return true;
    }
    return false;
}

// Corner guarded by an X-square, or nullopt if pos is not an X-square
[[nodiscard]] constexpr std::optional<Position> x_square_corner(const Position& pos) noexcept {
    for (const auto& xs : X_SQUARES) {
        if (xs.square == pos) return xs.corner;
    }
    return std::nullopt;
}

static_assert(X_SQUARES[0].square == Position{1, 1});
static_assert(X_SQUARES[3].square == Position{BOARD_SIZE - 2, BOARD_SIZE - 2});
static_assert(C_SQUARES[3].square == Position{1, BOARD_SIZE - 1});

} // namespace othello

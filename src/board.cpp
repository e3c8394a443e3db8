//
//  board.cpp
//  othello - Board parsing and text rendering
//

#include "board.hpp"
#include <format>

namespace othello {

std::expected<Board, std::string> Board::parse(const std::vector<std::string>& rows) {
    if (rows.size() != static_cast<size_t>(size)) {
        return std::unexpected(std::format("expected {} rows, got {}", size, rows.size()));
    }

    Board board;
    for (int row = 0; row < size; ++row) {
        const std::string& text = rows[row];
        if (text.size() != static_cast<size_t>(size)) {
            return std::unexpected(std::format("row {} must have {} cells, got {}",
                                               row, size, text.size()));
        }

        for (int col = 0; col < size; ++col) {
            auto player = char_to_player(text[col]);
            if (!player) {
                return std::unexpected(std::format("row {} column {} has invalid cell '{}'",
                                                   row, col, text[col]));
            }
            if (*player != Player::Empty) {
                board.set({row, col}, *player);
            }
        }
    }

    return board;
}

std::vector<std::string> Board::to_rows() const {
    std::vector<std::string> rows;
    rows.reserve(size);

    for (const auto& row : board_) {
        std::string text;
        text.reserve(size);
        for (Player cell : row) {
            text += player_to_char(cell);
        }
        rows.push_back(std::move(text));
    }

    return rows;
}

std::string Board::to_string() const {
    std::string result;
    result.reserve(total_cells + size);

    for (const auto& row : to_rows()) {
        if (!result.empty()) result += '\n';
        result += row;
    }

    return result;
}

} // namespace othello

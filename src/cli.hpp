//
//  cli.hpp
//  othello - Modern C++23 Command Line Interface module
//
//  Handles command-line argument parsing and help display for the terminal game
//

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include "othello.hpp"

namespace othello::cli {

//===============================================================================
// CLI CONFIGURATION STRUCTURE
//===============================================================================

/**
 * One seat at the table
 */
struct PlayerConfig {
    PlayerType type = PlayerType::Human;
    std::string name;                       // Empty means a generated name
    std::optional<Difficulty> difficulty;   // Computer only; falls back to --level

    PlayerConfig() = default;
    explicit PlayerConfig(PlayerType t) : type(t) {}
    PlayerConfig(PlayerType t, std::string_view n) : type(t), name(n) {}
    PlayerConfig(PlayerType t, Difficulty d) : type(t), difficulty(d) {}
};

struct Config {
    Difficulty level = Difficulty::Medium;  // Default strength of computer players
    bool show_help = false;
    bool enable_undo = false;
    bool skip_welcome = false;
    std::optional<uint32_t> seed;           // Fixed seed for the random (easy) opponent

    PlayerConfig black = PlayerConfig(PlayerType::Human);       // Moves first
    PlayerConfig white = PlayerConfig(PlayerType::Computer);

    [[nodiscard]] std::expected<void, std::string> validate() const;

    [[nodiscard]] Difficulty difficulty_for(const PlayerConfig& player) const noexcept {
        return player.difficulty.value_or(level);
    }

    [[nodiscard]] GameMode mode() const noexcept {
        return black.type == PlayerType::Human && white.type == PlayerType::Human
            ? GameMode::PlayerVsPlayer
            : GameMode::PlayerVsComputer;
    }
};

//===============================================================================
// ERROR TYPES
//===============================================================================

enum class ParseError {
    InvalidArgument,
    InvalidLevel,
    InvalidPlayers,
    InvalidSeed,
    UnknownOption,
    MissingValue
};

//===============================================================================
// CLI FUNCTIONS
//===============================================================================

/**
 * Parses command line arguments.
 *
 * @param args Span of command line arguments, program name first
 * @return Expected configuration or error
 */
[[nodiscard]] std::expected<Config, ParseError> parse_arguments(std::span<const char*> args);

/**
 * Parses a players string like "human,computer" or "computer:hard,human:Alice".
 * The first entry plays black.
 */
[[nodiscard]] std::expected<std::pair<PlayerConfig, PlayerConfig>, ParseError>
parse_players_string(std::string_view players);

void print_help(std::string_view program_name);

[[nodiscard]] std::string_view error_to_string(ParseError error);

} // namespace othello::cli

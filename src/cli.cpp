//
//  cli.cpp
//  othello - Modern C++23 Command Line Interface module
//
//  Handles command-line argument parsing and help display for the terminal game
//

#include <array>
#include <charconv>
#include <format>
#include <iostream>
#include <getopt.h>
#include "cli.hpp"
#include "ansi.h"

namespace othello::cli {

//===============================================================================
// CONFIG VALIDATION
//===============================================================================

std::expected<void, std::string> Config::validate() const {
    if (enable_undo && black.type == PlayerType::Computer && white.type == PlayerType::Computer) {
        return std::unexpected("Undo needs at least one human player");
    }

    if (seed && black.type == PlayerType::Human && white.type == PlayerType::Human) {
        return std::unexpected("A seed only applies to computer players");
    }

    if (black.type == PlayerType::Human && white.type == PlayerType::Human &&
        !black.name.empty() && black.name == white.name) {
        return std::unexpected("Human players must have different names");
    }

    return {};
}

//===============================================================================
// HELPER FUNCTIONS
//===============================================================================

namespace {

    std::optional<PlayerType> parse_player_type(std::string_view text) {
        if (text == "human") return PlayerType::Human;
        if (text == "computer") return PlayerType::Computer;
        return std::nullopt;
    }

    std::expected<PlayerConfig, ParseError> parse_single_player(std::string_view text) {
        const auto colon = text.find(':');
        const auto type = parse_player_type(text.substr(0, colon));
        if (!type) {
            return std::unexpected(ParseError::InvalidPlayers);
        }

        PlayerConfig config{*type};
        if (colon == std::string_view::npos) {
            return config;
        }

        const std::string_view param = text.substr(colon + 1);
        if (param.empty()) {
            return std::unexpected(ParseError::MissingValue);
        }

        if (*type == PlayerType::Computer) {
            const auto difficulty = parse_difficulty(param);
            if (!difficulty) {
                return std::unexpected(ParseError::InvalidLevel);
            }
            config.difficulty = *difficulty;
        } else {
            config.name = std::string{param};
        }

        return config;
    }

} // namespace

std::expected<std::pair<PlayerConfig, PlayerConfig>, ParseError>
parse_players_string(std::string_view players) {
    const auto comma = players.find(',');
    if (comma == std::string_view::npos) {
        return std::unexpected(ParseError::InvalidPlayers);
    }

    auto first = parse_single_player(players.substr(0, comma));
    if (!first) return std::unexpected(first.error());

    auto second = parse_single_player(players.substr(comma + 1));
    if (!second) return std::unexpected(second.error());

    return std::pair{std::move(*first), std::move(*second)};
}

//===============================================================================
// ARGUMENT PARSING
//===============================================================================

std::expected<Config, ParseError> parse_arguments(std::span<const char*> args) {
    Config config{};

    if (args.empty()) {
        return config;
    }

    int argc = static_cast<int>(args.size());
    char** argv = const_cast<char**>(args.data());

    // 0 rather than 1 makes glibc drop any state left by a previous parse
    optind = 0;

    static constexpr std::array long_options = {
        option{"level", required_argument, nullptr, 'l'},
        option{"players", required_argument, nullptr, 'p'},
        option{"seed", required_argument, nullptr, 'S'},
        option{"help", no_argument, nullptr, 'h'},
        option{"undo", no_argument, nullptr, 'u'},
        option{"skip-welcome", no_argument, nullptr, 's'},
        option{nullptr, 0, nullptr, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "l:p:S:hus",
                            const_cast<option*>(long_options.data()), &option_index)) != -1) {
        switch (c) {
            case 'l': {
                const auto level = parse_difficulty(optarg);
                if (!level) {
                    return std::unexpected(ParseError::InvalidLevel);
                }
                config.level = *level;
                break;
            }

            case 'p': {
                auto players = parse_players_string(optarg);
                if (!players) {
                    return std::unexpected(players.error());
                }
                config.black = std::move(players->first);
                config.white = std::move(players->second);
                break;
            }

            case 'S': {
                const std::string_view text{optarg};
                uint32_t seed = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seed);
                if (ec != std::errc{} || ptr != text.data() + text.size()) {
                    return std::unexpected(ParseError::InvalidSeed);
                }
                config.seed = seed;
                break;
            }

            case 'u':
                config.enable_undo = true;
                break;

            case 's':
                config.skip_welcome = true;
                break;

            case 'h':
                config.show_help = true;
                break;

            case '?':
                return std::unexpected(ParseError::UnknownOption);

            default:
                return std::unexpected(ParseError::InvalidArgument);
        }
    }

    if (optind < argc) {
        return std::unexpected(ParseError::InvalidArgument);
    }

    return config;
}

//===============================================================================
// HELP AND ERROR HANDLING
//===============================================================================

void print_help(std::string_view program_name) {
    std::cout << std::format("\n{}NAME{}\n", COLOR_BRIGHT_MAGENTA, COLOR_RESET);
    std::cout << std::format("  {} - {} for the terminal\n\n", program_name, GAME_DESCRIPTION);

    std::cout << std::format("{}FLAGS:{}\n", COLOR_BRIGHT_MAGENTA, COLOR_RESET);
    std::cout << std::format("  {}-l, --level M{}         Can be \"easy\", \"medium\", \"hard\"\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("  {}-p, --players SPEC{}    Player configuration (see below)\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("  {}-S, --seed N{}          Seed for the easy opponent's random choices\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("  {}-u, --undo{}            Enable the Undo feature\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("  {}-s, --skip-welcome{}    Skip the welcome screen\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("  {}-h, --help{}            Show this help message\n",
                             COLOR_YELLOW, COLOR_RESET);

    std::cout << std::format("\n{}PLAYER CONFIGURATION:{}\n", COLOR_BRIGHT_MAGENTA, COLOR_RESET);
    std::cout << std::format("  Format: --players BLACK,WHITE (black moves first)\n");
    std::cout << std::format("  Player types: {}human{} or {}computer{}\n",
                             COLOR_GREEN, COLOR_RESET, COLOR_GREEN, COLOR_RESET);
    std::cout << std::format("  Examples:\n");
    std::cout << std::format("    {}--players human,computer{}        (default: you play black)\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("    {}--players computer,human{}        (computer moves first)\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("    {}--players computer:hard,human{}   (hard computer vs human)\n",
                             COLOR_YELLOW, COLOR_RESET);
    std::cout << std::format("    {}--players human:Alice,human:Bob{} (named human players)\n",
                             COLOR_YELLOW, COLOR_RESET);

    std::cout << std::format("\n{}DIFFICULTY LEVELS:{}\n", COLOR_BRIGHT_MAGENTA, COLOR_RESET);
    std::cout << std::format("  {}easy{}   - Picks any legal move at random\n", COLOR_GREEN, COLOR_RESET);
    std::cout << std::format("  {}medium{} - Corners, edges and big captures first (default)\n",
                             COLOR_GREEN, COLOR_RESET);
    std::cout << std::format("  {}hard{}   - Looks 6 moves ahead with alpha-beta search\n",
                             COLOR_GREEN, COLOR_RESET);

    std::cout << std::format("\n  {}Version {}{}\n\n", COLOR_BRIGHT_MAGENTA, GAME_VERSION, COLOR_RESET);
}

std::string_view error_to_string(ParseError error) {
    using namespace std::string_view_literals;

    switch (error) {
        case ParseError::InvalidArgument:
            return "Invalid argument provided"sv;
        case ParseError::InvalidLevel:
            return "Level must be one of easy, medium or hard"sv;
        case ParseError::InvalidPlayers:
            return "Players must look like human,computer or computer:hard,human:Alice"sv;
        case ParseError::InvalidSeed:
            return "Seed must be a non-negative integer"sv;
        case ParseError::UnknownOption:
            return "Unknown option or missing argument"sv;
        case ParseError::MissingValue:
            return "Missing required value for option"sv;
    }
    return "Unknown error"sv;
}

} // namespace othello::cli

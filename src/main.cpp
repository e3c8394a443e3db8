//
//  main.cpp
//  othello - Terminal game entry point
//
//  Parses the command line and hands control to the GameCoordinator
//

#include <exception>
#include <format>
#include <iostream>
#include <span>
#include "othello.hpp"
#include "cli.hpp"
#include "ui.hpp"
#include "game_coordinator.hpp"
#include "ansi.h"

int main(int argc, char* argv[]) {
    using namespace othello;

    std::span<const char*> args{const_cast<const char**>(argv), static_cast<size_t>(argc)};
    auto config = cli::parse_arguments(args);

    if (!config) {
        std::cerr << std::format("{}Error: {}{}\n", COLOR_BRIGHT_RED,
                                 cli::error_to_string(config.error()), COLOR_RESET);
        cli::print_help(argv[0]);
        return 1;
    }

    if (config->show_help) {
        cli::print_help(argv[0]);
        return 0;
    }

    if (auto valid = config->validate(); !valid) {
        std::cerr << std::format("{}Error: {}{}\n", COLOR_BRIGHT_RED, valid.error(), COLOR_RESET);
        return 1;
    }

    if (!config->skip_welcome) {
        ui::draw_game_header(std::cout);
    }

    try {
        GameCoordinator coordinator(*config, std::cin, std::cout);
        return coordinator.run_game();
    } catch (const std::exception& e) {
        std::cerr << std::format("{}Error: {}{}\n", COLOR_BRIGHT_RED, e.what(), COLOR_RESET);
        return 1;
    }
}

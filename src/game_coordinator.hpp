//
//  game_coordinator.hpp
//  othello - Game coordination using the Player hierarchy
//
//  Drives the turn loop between two players over a GameState value
//

#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include "player.hpp"
#include "game.hpp"
#include "cli.hpp"
#include "ui.hpp"

namespace othello {

class GameCoordinator {
public:
    /**
     * Creates the coordinator and both players. Human input is read from in,
     * everything is drawn to out.
     */
    GameCoordinator(const cli::Config& config, std::istream& in, std::ostream& out);

    /**
     * Run the main game loop until the game ends or a player quits.
     * @return Exit code (0 = success)
     */
    int run_game();

    [[nodiscard]] const GameState& get_game_state() const { return state_; }
    [[nodiscard]] bool was_quit() const { return quit_; }

    PlayerImpl* get_current_player() {
        return player_for(state_.current_player);
    }

    std::string get_black_name() const { return black_->get_name(); }
    std::string get_white_name() const { return white_->get_name(); }

private:
    cli::Config config_;
    ui::TerminalInput input_;
    std::ostream& out_;

    GameState state_;
    bool quit_ = false;

    std::unique_ptr<PlayerImpl> black_;    // Moves first
    std::unique_ptr<PlayerImpl> white_;

    PlayerImpl* player_for(Player side) const {
        return side == Player::Black ? black_.get() : white_.get();
    }

    /**
     * Ask the current player for an action and apply it
     */
    void make_player_move();

    /**
     * Takes back moves until a human is to move again
     */
    void handle_undo();
};

} // namespace othello

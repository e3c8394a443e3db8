//
//  player.hpp
//  othello - Player abstraction for different player types
//
//  Abstract Player hierarchy supporting human and computer players
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include "othello.hpp"
#include "game.hpp"
#include "ai.hpp"
#include "cli.hpp"
#include "ui.hpp"

namespace othello {

//===============================================================================
// MOVE RESULT STRUCTURE
//===============================================================================

/**
 * What a player decided to do on its turn
 */
struct PlayerMoveResult {
    enum class Action : uint8_t {
        Move,
        Undo,
        Quit
    };

    Action action = Action::Quit;
    Position pos;
    double time_taken = 0.0;
    SearchStats stats;           // Computer players only

    static PlayerMoveResult quit() {
        return {Action::Quit, {}, 0.0, {}};
    }

    static PlayerMoveResult undo() {
        return {Action::Undo, {}, 0.0, {}};
    }

    static PlayerMoveResult move(const Position& pos, double time, const SearchStats& stats = {}) {
        return {Action::Move, pos, time, stats};
    }
};

//===============================================================================
// ABSTRACT PLAYER BASE CLASS
//===============================================================================

class PlayerImpl {
public:
    PlayerImpl(const std::string& name, PlayerType type)
        : name_(name), type_(type) {}

    virtual ~PlayerImpl() = default;

    /**
     * Decides the next action for the side to move in state. Only called
     * while state has at least one legal move.
     */
    virtual PlayerMoveResult make_move(const GameState& state) = 0;

    virtual void on_game_start(const GameState&) {}

    const std::string& get_name() const { return name_; }
    PlayerType get_type() const { return type_; }
    void set_name(const std::string& name) { name_ = name; }

protected:
    std::string name_;
    PlayerType type_;
};

//===============================================================================
// PLAYER TYPES
//===============================================================================

/**
 * Reads commands from the terminal until a legal move, undo or quit is given.
 * Hints and the rules screen are served without ending the turn.
 */
class HumanPlayer : public PlayerImpl {
public:
    HumanPlayer(const std::string& name, ui::TerminalInput& input, bool undo_enabled)
        : PlayerImpl(name, PlayerType::Human), input_(input), undo_enabled_(undo_enabled) {}

    PlayerMoveResult make_move(const GameState& state) override;

private:
    ui::TerminalInput& input_;
    bool undo_enabled_;
};

class ComputerPlayer : public PlayerImpl {
public:
    ComputerPlayer(const std::string& name, Difficulty difficulty,
                   std::optional<uint32_t> seed = std::nullopt)
        : PlayerImpl(name, PlayerType::Computer), difficulty_(difficulty),
          rng_(seed ? *seed : std::random_device{}()) {}

    PlayerMoveResult make_move(const GameState& state) override;

    Difficulty get_difficulty() const { return difficulty_; }
    void set_difficulty(Difficulty difficulty) { difficulty_ = difficulty; }

private:
    Difficulty difficulty_;
    std::mt19937 rng_;
};

//===============================================================================
// PLAYER FACTORY
//===============================================================================

class PlayerFactory {
public:
    /**
     * Builds the player for one seat. Unnamed computers get the classical
     * name of their difficulty, unnamed humans "Player 1" / "Player 2".
     */
    static std::unique_ptr<PlayerImpl> create_player(const cli::PlayerConfig& seat, int player_number,
                                                     const cli::Config& config,
                                                     ui::TerminalInput& input);

    static std::string get_classical_name(Difficulty difficulty);

private:
    static std::string generate_default_name(PlayerType type, int player_number);
};

} // namespace othello

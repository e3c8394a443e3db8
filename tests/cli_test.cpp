//
//  cli_test.cpp
//  othello tests - Command line parsing, configuration checks and input commands
//

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "cli.hpp"
#include "player.hpp"
#include "ui.hpp"

using namespace othello;
using namespace othello::cli;

namespace {

    std::expected<Config, ParseError> parse(std::vector<const char*> args) {
        args.insert(args.begin(), "othello");
        return parse_arguments(std::span<const char*>(args.data(), args.size()));
    }

} // namespace

//===============================================================================
// ARGUMENT PARSING
//===============================================================================

TEST(CliTest, Defaults) {
    auto config = parse({});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->level, Difficulty::Medium);
    EXPECT_EQ(config->black.type, PlayerType::Human);
    EXPECT_EQ(config->white.type, PlayerType::Computer);
    EXPECT_FALSE(config->enable_undo);
    EXPECT_FALSE(config->seed.has_value());
    EXPECT_EQ(config->mode(), GameMode::PlayerVsComputer);
    EXPECT_TRUE(config->validate().has_value());
}

TEST(CliTest, ShortFlags) {
    auto config = parse({"-l", "hard", "-u", "-s", "-S", "17"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->level, Difficulty::Hard);
    EXPECT_TRUE(config->enable_undo);
    EXPECT_TRUE(config->skip_welcome);
    EXPECT_EQ(config->seed, 17u);
    EXPECT_EQ(config->difficulty_for(config->white), Difficulty::Hard);
}

TEST(CliTest, LongFlags) {
    auto config = parse({"--level", "easy", "--players", "computer:hard,human:Alice", "--undo", "--help"});
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->show_help);
    EXPECT_EQ(config->black.type, PlayerType::Computer);
    EXPECT_EQ(config->black.difficulty, Difficulty::Hard);
    EXPECT_EQ(config->white.type, PlayerType::Human);
    EXPECT_EQ(config->white.name, "Alice");

    // Per-seat difficulty wins over --level
    EXPECT_EQ(config->difficulty_for(config->black), Difficulty::Hard);
}

TEST(CliTest, RejectsBadValues) {
    auto level = parse({"--level", "insane"});
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error(), ParseError::InvalidLevel);

    auto seed = parse({"--seed", "abc"});
    ASSERT_FALSE(seed.has_value());
    EXPECT_EQ(seed.error(), ParseError::InvalidSeed);

    auto negative = parse({"-S", "-1"});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error(), ParseError::InvalidSeed);

    auto unknown = parse({"--bogus"});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), ParseError::UnknownOption);

    auto stray = parse({"-u", "extra"});
    ASSERT_FALSE(stray.has_value());
    EXPECT_EQ(stray.error(), ParseError::InvalidArgument);
}

TEST(CliTest, RepeatedParsesStartFresh) {
    ASSERT_TRUE(parse({"-l", "easy"}).has_value());
    auto config = parse({"-l", "hard"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->level, Difficulty::Hard);
}

//===============================================================================
// PLAYERS STRING
//===============================================================================

TEST(PlayersTest, ParsesBothSeats) {
    auto players = parse_players_string("human,human");
    ASSERT_TRUE(players.has_value());
    EXPECT_EQ(players->first.type, PlayerType::Human);
    EXPECT_EQ(players->second.type, PlayerType::Human);
    EXPECT_TRUE(players->first.name.empty());

    auto computers = parse_players_string("computer:easy,computer");
    ASSERT_TRUE(computers.has_value());
    EXPECT_EQ(computers->first.difficulty, Difficulty::Easy);
    EXPECT_FALSE(computers->second.difficulty.has_value());
}

TEST(PlayersTest, RejectsMalformedStrings) {
    EXPECT_EQ(parse_players_string("human").error(), ParseError::InvalidPlayers);
    EXPECT_EQ(parse_players_string("robot,human").error(), ParseError::InvalidPlayers);
    EXPECT_EQ(parse_players_string("computer:,human").error(), ParseError::MissingValue);
    EXPECT_EQ(parse_players_string("human,computer:genius").error(), ParseError::InvalidLevel);

    auto via_flag = parse({"-p", "human"});
    ASSERT_FALSE(via_flag.has_value());
    EXPECT_EQ(via_flag.error(), ParseError::InvalidPlayers);
}

//===============================================================================
// CONFIG VALIDATION
//===============================================================================

TEST(ValidateTest, RejectsInconsistentCombinations) {
    Config config;
    config.black = PlayerConfig(PlayerType::Computer);
    config.white = PlayerConfig(PlayerType::Computer);
    config.enable_undo = true;
    EXPECT_FALSE(config.validate().has_value());

    config.enable_undo = false;
    EXPECT_TRUE(config.validate().has_value());

    Config humans;
    humans.black = PlayerConfig(PlayerType::Human, "Ann");
    humans.white = PlayerConfig(PlayerType::Human, "Ann");
    EXPECT_FALSE(humans.validate().has_value());

    humans.white.name = "Bob";
    EXPECT_TRUE(humans.validate().has_value());
    EXPECT_EQ(humans.mode(), GameMode::PlayerVsPlayer);

    humans.seed = 3;
    EXPECT_FALSE(humans.validate().has_value());
}

TEST(ValidateTest, ErrorMessages) {
    for (auto error : {ParseError::InvalidArgument, ParseError::InvalidLevel, ParseError::InvalidPlayers,
                       ParseError::InvalidSeed, ParseError::UnknownOption, ParseError::MissingValue}) {
        EXPECT_FALSE(error_to_string(error).empty());
    }
}

//===============================================================================
// PLAYER FACTORY
//===============================================================================

TEST(PlayerFactoryTest, NamesAndTypes) {
    std::istringstream in;
    std::ostringstream out;
    ui::TerminalInput input(in, out);

    Config config;
    config.level = Difficulty::Hard;

    auto computer = PlayerFactory::create_player(PlayerConfig(PlayerType::Computer), 2, config, input);
    ASSERT_NE(computer, nullptr);
    EXPECT_EQ(computer->get_type(), PlayerType::Computer);
    EXPECT_EQ(computer->get_name(), "Archimedes");

    auto human = PlayerFactory::create_player(PlayerConfig(PlayerType::Human), 2, config, input);
    ASSERT_NE(human, nullptr);
    EXPECT_EQ(human->get_name(), "Player 2");

    auto named = PlayerFactory::create_player(PlayerConfig(PlayerType::Human, "Alice"), 1, config, input);
    EXPECT_EQ(named->get_name(), "Alice");
}

TEST(PlayerFactoryTest, SeededComputersAreReproducible) {
    const GameState state = new_game();
    ComputerPlayer first("a", Difficulty::Easy, 11);
    ComputerPlayer second("b", Difficulty::Easy, 11);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(first.make_move(state).pos, second.make_move(state).pos);
    }
}

//===============================================================================
// INPUT COMMANDS
//===============================================================================

TEST(CommandTest, Moves) {
    auto move = ui::parse_command("d3");
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->type, ui::CommandType::Move);
    EXPECT_EQ(move->pos, (Position{2, 3}));

    auto padded = ui::parse_command("  H 8 ");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(padded->pos, (Position{7, 7}));
}

TEST(CommandTest, Keywords) {
    EXPECT_EQ(ui::parse_command("q")->type, ui::CommandType::Quit);
    EXPECT_EQ(ui::parse_command("QUIT")->type, ui::CommandType::Quit);
    EXPECT_EQ(ui::parse_command("u")->type, ui::CommandType::Undo);
    EXPECT_EQ(ui::parse_command("h")->type, ui::CommandType::Hint);
    EXPECT_EQ(ui::parse_command("?")->type, ui::CommandType::Rules);
}

TEST(CommandTest, RejectsGarbage) {
    EXPECT_FALSE(ui::parse_command("").has_value());
    EXPECT_FALSE(ui::parse_command("   ").has_value());
    EXPECT_FALSE(ui::parse_command("z9").has_value());
    EXPECT_FALSE(ui::parse_command("d").has_value());

    auto error = ui::parse_command("j1");
    ASSERT_FALSE(error.has_value());
    EXPECT_NE(error.error().find("j1"), std::string::npos);
}

TEST(TerminalInputTest, ReadsLinesUntilExhausted) {
    std::istringstream in("d3\n");
    std::ostringstream out;
    ui::TerminalInput input(in, out);

    EXPECT_EQ(input.read_line("Black >"), "d3");
    EXPECT_FALSE(input.read_line("Black >").has_value());
    EXPECT_NE(out.str().find("Black >"), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

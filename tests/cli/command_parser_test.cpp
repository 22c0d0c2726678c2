#include <gtest/gtest.h>
#include "gambit/cli/command_parser.h"

namespace gambit {
namespace cli {

class CommandParserTest : public ::testing::Test {
};

TEST_F(CommandParserTest, TokenizeSplitsOnWhitespace) {
    EXPECT_EQ(CommandParser::tokenize("  moves   e2 "), (std::vector<std::string>{"moves", "e2"}));
    EXPECT_TRUE(CommandParser::tokenize("   ").empty());
}

TEST_F(CommandParserTest, TokenizeKeepsQuotedText) {
    auto tokens = CommandParser::tokenize(R"(new "4k3/8/8/8/8/8/8/4K2R w K - 0 1")");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "new");
    EXPECT_EQ(tokens[1], "4k3/8/8/8/8/8/8/4K2R w K - 0 1");

    EXPECT_EQ(CommandParser::tokenize(R"(save "game")"), (std::vector<std::string>{"save", "game"}));
}

TEST_F(CommandParserTest, ExtractFlags) {
    std::vector<std::string> args = {"--white", "random", "--seed=7", "--help", "extra"};
    auto flags = CommandParser::extractFlags(args);

    EXPECT_EQ(CommandParser::getFlagValue(flags, "white"), "random");
    EXPECT_EQ(CommandParser::getFlagValueInt(flags, "seed"), 7);
    EXPECT_TRUE(CommandParser::hasFlag(flags, "help"));
    EXPECT_FALSE(CommandParser::hasFlag(flags, "black"));
    EXPECT_EQ(CommandParser::getFlagValue(flags, "black", "greedy"), "greedy");

    // The bare flag took "extra" as its value
    EXPECT_EQ(CommandParser::getFlagValue(flags, "help"), "extra");
    EXPECT_TRUE(args.empty());
}

TEST_F(CommandParserTest, ExtractFlagsLeavesPositionalArguments) {
    std::vector<std::string> args = {"positional", "--max-plies", "40", "--record"};
    auto flags = CommandParser::extractFlags(args);

    EXPECT_EQ(args, (std::vector<std::string>{"positional"}));
    EXPECT_EQ(CommandParser::getFlagValueInt(flags, "max-plies"), 40);
    EXPECT_TRUE(CommandParser::hasFlag(flags, "record"));
    EXPECT_EQ(CommandParser::getFlagValue(flags, "record"), "");
}

TEST_F(CommandParserTest, FlagIntFallsBackOnBadValue) {
    std::map<std::string, std::string> flags = {{"seed", "abc"}, {"plies", "12x"}};
    EXPECT_EQ(CommandParser::getFlagValueInt(flags, "seed", 5), 5);
    EXPECT_EQ(CommandParser::getFlagValueInt(flags, "plies", -1), -1);
    EXPECT_EQ(CommandParser::getFlagValueInt(flags, "missing", 3), 3);
}

TEST_F(CommandParserTest, ParseSeparatedMove) {
    auto move = CommandParser::parseMove({"e2", "e4"});
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->from, "e2");
    EXPECT_EQ(move->to, "e4");
    EXPECT_EQ(move->promotion, '\0');

    auto promotion = CommandParser::parseMove({"E7", "E8", "N"});
    ASSERT_TRUE(promotion.has_value());
    EXPECT_EQ(promotion->from, "e7");
    EXPECT_EQ(promotion->to, "e8");
    EXPECT_EQ(promotion->promotion, 'n');
}

TEST_F(CommandParserTest, ParseJoinedMove) {
    auto move = CommandParser::parseMove({"g1f3"});
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->from, "g1");
    EXPECT_EQ(move->to, "f3");

    auto promotion = CommandParser::parseMove({"a7a8q"});
    ASSERT_TRUE(promotion.has_value());
    EXPECT_EQ(promotion->promotion, 'q');
}

TEST_F(CommandParserTest, RejectsNonMoves) {
    EXPECT_FALSE(CommandParser::parseMove({}).has_value());
    EXPECT_FALSE(CommandParser::parseMove({"hello"}).has_value());
    EXPECT_FALSE(CommandParser::parseMove({"e2e4x"}).has_value());
    EXPECT_FALSE(CommandParser::parseMove({"e2", "e4", "k"}).has_value());
    EXPECT_FALSE(CommandParser::parseMove({"e2", "e4", "q", "extra"}).has_value());

    // Shape is checked here, range is left to the engine
    EXPECT_TRUE(CommandParser::parseMove({"z9", "e4"}).has_value());
}

} // namespace cli
} // namespace gambit

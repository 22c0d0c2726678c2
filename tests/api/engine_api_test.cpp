#include <gtest/gtest.h>
#include "gambit/api/engine_api.h"
#include "gambit/ai/greedy_selector.h"
#include "gambit/ai/random_selector.h"

namespace gambit {
namespace api {

class EngineApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = newGame();
        ASSERT_NE(state, nullptr);
    }

    std::unique_ptr<chess::ChessState> state;
};

TEST_F(EngineApiTest, NewGameStandardPosition) {
    EXPECT_EQ(state->toFEN(), chess::ChessState::STARTING_FEN);
    EXPECT_EQ(status(*state), chess::GameStatus::IN_PROGRESS);
}

TEST_F(EngineApiTest, NewGameFromPlacement) {
    auto custom = newGame("4k3/8/8/8/8/8/8/4K2R");
    ASSERT_NE(custom, nullptr);
    EXPECT_EQ(custom->getCurrentPlayer(), chess::PieceColor::WHITE);
    EXPECT_TRUE(custom->getCastlingRights().white_kingside);
    EXPECT_EQ(custom->getEnPassantSquare(), chess::NO_SQUARE);

    auto blackToMove = newGame("4k3/8/8/8/8/8/8/4K2R b - - 0 1");
    ASSERT_NE(blackToMove, nullptr);
    EXPECT_EQ(blackToMove->getCurrentPlayer(), chess::PieceColor::BLACK);
}

TEST_F(EngineApiTest, NewGameRejectsMalformedPosition) {
    EXPECT_EQ(newGame("rnbqkbnr/pppppppp/8/8"), nullptr);
    EXPECT_EQ(newGame("xyz"), nullptr);
}

TEST_F(EngineApiTest, LegalDestinationsInBoardOrder) {
    EXPECT_EQ(legalDestinations(*state, "e2"), (std::vector<std::string>{"e4", "e3"}));
    EXPECT_EQ(legalDestinations(*state, "b1"), (std::vector<std::string>{"a3", "c3"}));
    EXPECT_TRUE(legalDestinations(*state, "e4").empty());
    EXPECT_TRUE(legalDestinations(*state, "e7").empty());   // Not on move
    EXPECT_TRUE(legalDestinations(*state, "z9").empty());
}

TEST_F(EngineApiTest, AttemptMove) {
    chess::MoveOutcome outcome = attemptMove(*state, "e2", "e4");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.message, "Move Successful");
    EXPECT_EQ(state->getCurrentPlayer(), chess::PieceColor::BLACK);

    outcome = attemptMove(*state, "e4", "e5");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "Illegal Move");

    outcome = attemptMove(*state, "e7", "e9");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message.rfind("Invalid square coordinates", 0), 0u);
}

TEST_F(EngineApiTest, AttemptMoveWithPromotion) {
    auto promoting = newGame("7k/P7/8/8/8/8/8/K7 w - - 0 1");
    ASSERT_NE(promoting, nullptr);

    EXPECT_TRUE(attemptMove(*promoting, "a7", "a8", 'r').success);
    EXPECT_EQ(promoting->getPiece(chess::A8).type, chess::PieceType::ROOK);
}

TEST_F(EngineApiTest, SelectMove) {
    ai::GreedySelector white(chess::PieceColor::WHITE, 1);
    auto move = selectMove(white, *state);
    ASSERT_TRUE(move.has_value());
    EXPECT_TRUE(state->isLegalMove(move->from_square, move->to_square));

    ai::RandomSelector black(chess::PieceColor::BLACK, 1);
    EXPECT_FALSE(selectMove(black, *state).has_value());
}

TEST_F(EngineApiTest, SelectMoveOnFinishedGame) {
    auto finished = newGame("7k/8/8/8/8/8/PP6/K5r1 w - - 0 1");
    ASSERT_NE(finished, nullptr);
    ASSERT_EQ(status(*finished), chess::GameStatus::BLACK_WINS);

    ai::RandomSelector white(chess::PieceColor::WHITE, 1);
    EXPECT_FALSE(selectMove(white, *finished).has_value());
}

} // namespace api
} // namespace gambit

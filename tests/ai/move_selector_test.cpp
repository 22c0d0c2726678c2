#include <gtest/gtest.h>
#include "gambit/ai/move_selector.h"
#include "gambit/ai/random_selector.h"
#include "gambit/ai/greedy_selector.h"
#include "gambit/core/exceptions.h"
#include <algorithm>

namespace gambit {
namespace ai {

using chess::ChessMove;
using chess::ChessState;
using chess::PieceColor;

class MoveSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_unique<ChessState>();
    }

    static bool contains(const std::vector<ChessMove>& moves, const ChessMove& move) {
        return std::find(moves.begin(), moves.end(), move) != moves.end();
    }

    std::unique_ptr<ChessState> state;
};

TEST_F(MoveSelectorTest, FactoryCreatesByName) {
    auto random = createMoveSelector("random", PieceColor::WHITE, 1);
    auto greedy = createMoveSelector("greedy", PieceColor::BLACK, 1);

    EXPECT_EQ(random->getName(), "random");
    EXPECT_EQ(random->getColor(), PieceColor::WHITE);
    EXPECT_EQ(greedy->getName(), "greedy");
    EXPECT_EQ(greedy->getColor(), PieceColor::BLACK);

    EXPECT_THROW(createMoveSelector("minimax", PieceColor::WHITE), core::UnknownStrategyException);
    EXPECT_THROW(createMoveSelector("", PieceColor::WHITE), core::GameStateException);
}

TEST_F(MoveSelectorTest, RandomPicksLegalMoves) {
    RandomSelector selector(PieceColor::WHITE, 42);
    auto legal = state->getAllLegalMoves(PieceColor::WHITE);

    for (int i = 0; i < 50; ++i) {
        auto move = selector.selectMove(*state);
        ASSERT_TRUE(move.has_value());
        EXPECT_TRUE(contains(legal, *move));
    }
}

TEST_F(MoveSelectorTest, RandomIsReproducibleWithSeed) {
    RandomSelector first(PieceColor::WHITE, 7);
    RandomSelector second(PieceColor::WHITE, 7);

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(first.selectMove(*state), second.selectMove(*state));
    }
}

TEST_F(MoveSelectorTest, RandomCoversSeveralMoves) {
    RandomSelector selector(PieceColor::WHITE, 3);
    std::vector<ChessMove> seen;

    for (int i = 0; i < 200; ++i) {
        auto move = selector.selectMove(*state);
        ASSERT_TRUE(move.has_value());
        if (!contains(seen, *move)) {
            seen.push_back(*move);
        }
    }
    EXPECT_GT(seen.size(), 10u);
}

TEST_F(MoveSelectorTest, NoMoveForSideNotOnMove) {
    RandomSelector random(PieceColor::BLACK, 1);
    GreedySelector greedy(PieceColor::BLACK, 1);

    EXPECT_FALSE(random.selectMove(*state).has_value());
    EXPECT_FALSE(greedy.selectMove(*state).has_value());
}

TEST_F(MoveSelectorTest, NoMoveWhenCheckmated) {
    ASSERT_TRUE(state->makeMove("f2", "f3").success);
    ASSERT_TRUE(state->makeMove("e7", "e5").success);
    ASSERT_TRUE(state->makeMove("g2", "g4").success);
    ASSERT_TRUE(state->makeMove("d8", "h4").success);

    RandomSelector random(PieceColor::WHITE, 1);
    GreedySelector greedy(PieceColor::WHITE, 1);
    EXPECT_FALSE(random.selectMove(*state).has_value());
    EXPECT_FALSE(greedy.selectMove(*state).has_value());
}

TEST_F(MoveSelectorTest, GreedyIsDeterministic) {
    GreedySelector first(PieceColor::WHITE, 1);
    GreedySelector second(PieceColor::WHITE, 999);

    auto move = first.selectMove(*state);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move, second.selectMove(*state));
    EXPECT_EQ(move, first.selectMove(*state));
}

TEST_F(MoveSelectorTest, GreedyDoesNotModifyState) {
    std::string before = state->toFEN();
    GreedySelector selector(PieceColor::WHITE, 1);
    selector.selectMove(*state);

    EXPECT_EQ(state->toFEN(), before);
    EXPECT_TRUE(state->getMoveHistory().empty());
}

TEST_F(MoveSelectorTest, GreedyTakesHangingQueen) {
    ASSERT_TRUE(state->setFromFEN("4k3/8/8/3q4/8/8/8/3RK3 w - - 0 1"));
    GreedySelector selector(PieceColor::WHITE, 1);

    auto move = selector.selectMove(*state);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->from_square, chess::D1);
    EXPECT_EQ(move->to_square, chess::D5);
}

TEST_F(MoveSelectorTest, GreedyPicksBestScoringMove) {
    GreedySelector selector(PieceColor::WHITE, 1);
    auto chosen = selector.selectMove(*state);
    ASSERT_TRUE(chosen.has_value());

    ChessState afterChosen(*state);
    ASSERT_TRUE(afterChosen.makeMove(*chosen).success);
    int chosenScore = GreedySelector::evaluate(afterChosen, PieceColor::WHITE);

    // No other move scores higher, and none scoring the same comes earlier
    for (const ChessMove& move : state->getAllLegalMoves(PieceColor::WHITE)) {
        ChessState next(*state);
        ASSERT_TRUE(next.makeMove(move).success);
        int score = GreedySelector::evaluate(next, PieceColor::WHITE);
        EXPECT_LE(score, chosenScore);
        if (move == *chosen) {
            break;
        }
        EXPECT_LT(score, chosenScore);
    }
}

TEST_F(MoveSelectorTest, GreedyMinimizesOpponentReplies) {
    // Only the opponent's replies count after a move, so the rook cutting
    // off the seventh rank (two king moves left) beats checks and castling
    ASSERT_TRUE(state->setFromFEN("4k3/8/8/8/8/8/8/R3K2R w KQ - 0 1"));
    GreedySelector selector(PieceColor::WHITE, 1);

    auto move = selector.selectMove(*state);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->from_square, chess::A1);
    EXPECT_EQ(move->to_square, chess::A7);
}

TEST_F(MoveSelectorTest, GreedyOpeningMove) {
    // Every opening move leaves Black 20 replies, so the first one enumerated wins
    GreedySelector selector(PieceColor::WHITE, 1);

    auto move = selector.selectMove(*state);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->from_square, chess::A2);
    EXPECT_EQ(move->to_square, chess::A4);
}

TEST_F(MoveSelectorTest, EvaluationTerms) {
    EXPECT_EQ(GreedySelector::material(state->getBoard(), PieceColor::WHITE), 39);
    EXPECT_EQ(GreedySelector::material(state->getBoard(), PieceColor::BLACK), 39);
    EXPECT_EQ(GreedySelector::mobility(*state, PieceColor::WHITE), 20);
    EXPECT_EQ(GreedySelector::mobility(*state, PieceColor::BLACK), 0);
    EXPECT_EQ(GreedySelector::evaluate(*state, PieceColor::WHITE), 20);
    EXPECT_EQ(GreedySelector::evaluate(*state, PieceColor::BLACK), -20);

    EXPECT_EQ(GreedySelector::pieceValue(chess::PieceType::PAWN), 1);
    EXPECT_EQ(GreedySelector::pieceValue(chess::PieceType::KNIGHT), 3);
    EXPECT_EQ(GreedySelector::pieceValue(chess::PieceType::BISHOP), 3);
    EXPECT_EQ(GreedySelector::pieceValue(chess::PieceType::ROOK), 5);
    EXPECT_EQ(GreedySelector::pieceValue(chess::PieceType::QUEEN), 9);
    EXPECT_EQ(GreedySelector::pieceValue(chess::PieceType::KING), 0);
}

} // namespace ai
} // namespace gambit

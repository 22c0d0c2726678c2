#include <gtest/gtest.h>
#include "gambit/games/chess/chess_rules.h"
#include <algorithm>

namespace gambit {
namespace chess {

class ChessRulesTest : public ::testing::Test {
protected:
    void SetUp() override {
        rights = CastlingRights();
    }

    bool legal(int from, int to, PieceColor player, int ep = NO_SQUARE) const {
        return ChessRules(board).isLegalMove(from, to, player, rights, ep);
    }

    ChessBoard board;
    CastlingRights rights;
};

TEST_F(ChessRulesTest, StartingPositionHasTwentyMoves) {
    board = ChessBoard::standard();
    ChessRules rules(board);

    EXPECT_EQ(rules.generateLegalMoves(PieceColor::WHITE, rights, NO_SQUARE).size(), 20u);
    EXPECT_EQ(rules.generateLegalMoves(PieceColor::BLACK, rights, NO_SQUARE).size(), 20u);
}

TEST_F(ChessRulesTest, MovesAreOrderedByOriginThenDestination) {
    board = ChessBoard::standard();
    auto moves = ChessRules(board).generateLegalMoves(PieceColor::WHITE, rights, NO_SQUARE);

    EXPECT_TRUE(std::is_sorted(moves.begin(), moves.end(), [](const ChessMove& a, const ChessMove& b) {
        return a.from_square != b.from_square ? a.from_square < b.from_square : a.to_square < b.to_square;
    }));
    EXPECT_EQ(moves.front().from_square, A2);
    EXPECT_EQ(moves.front().to_square, A4);
}

TEST_F(ChessRulesTest, SquareAttackedByPawnsOnlyDiagonally) {
    board.setPiece(E4, {PieceType::PAWN, PieceColor::WHITE});
    ChessRules rules(board);

    EXPECT_TRUE(rules.isSquareAttacked(D5, PieceColor::WHITE));
    EXPECT_TRUE(rules.isSquareAttacked(F5, PieceColor::WHITE));
    EXPECT_FALSE(rules.isSquareAttacked(E5, PieceColor::WHITE));
    EXPECT_FALSE(rules.isSquareAttacked(D3, PieceColor::WHITE));
    EXPECT_FALSE(rules.isSquareAttacked(D5, PieceColor::BLACK));
}

TEST_F(ChessRulesTest, SlidingAttacksStopAtFirstBlocker) {
    board.setPiece(A1, {PieceType::ROOK, PieceColor::BLACK});
    board.setPiece(A4, {PieceType::PAWN, PieceColor::WHITE});
    board.setPiece(H8, {PieceType::BISHOP, PieceColor::BLACK});
    ChessRules rules(board);

    EXPECT_TRUE(rules.isSquareAttacked(A3, PieceColor::BLACK));
    EXPECT_TRUE(rules.isSquareAttacked(A4, PieceColor::BLACK));
    EXPECT_FALSE(rules.isSquareAttacked(A5, PieceColor::BLACK));
    EXPECT_TRUE(rules.isSquareAttacked(A1 + 7, PieceColor::BLACK));  // h1 along the rank
    EXPECT_TRUE(rules.isSquareAttacked(B2, PieceColor::BLACK));      // Bishop diagonal
    EXPECT_FALSE(rules.isSquareAttacked(H1 - 8, PieceColor::BLACK)); // h2: bishop does not attack orthogonally
}

TEST_F(ChessRulesTest, SquareAttackedByKnightAndKing) {
    board.setPiece(G1, {PieceType::KNIGHT, PieceColor::WHITE});
    board.setPiece(E8, {PieceType::KING, PieceColor::BLACK});
    ChessRules rules(board);

    EXPECT_TRUE(rules.isSquareAttacked(F3, PieceColor::WHITE));
    EXPECT_TRUE(rules.isSquareAttacked(E2, PieceColor::WHITE));
    EXPECT_FALSE(rules.isSquareAttacked(G3, PieceColor::WHITE));
    EXPECT_TRUE(rules.isSquareAttacked(D7, PieceColor::BLACK));
    EXPECT_FALSE(rules.isSquareAttacked(E6, PieceColor::BLACK));
}

TEST_F(ChessRulesTest, MissingKingCountsAsCheck) {
    board.setPiece(E1, {PieceType::KING, PieceColor::WHITE});
    ChessRules rules(board);

    EXPECT_FALSE(rules.isInCheck(PieceColor::WHITE));
    EXPECT_TRUE(rules.isInCheck(PieceColor::BLACK));
}

TEST_F(ChessRulesTest, PinnedPieceCannotMove) {
    ASSERT_TRUE(board.setFromPlacement("4k3/4r3/8/8/8/8/4B3/4K3"));

    EXPECT_FALSE(legal(E2, D3, PieceColor::WHITE));
    EXPECT_FALSE(legal(E2, F3, PieceColor::WHITE));
    EXPECT_TRUE(ChessRules(board).legalDestinations(E2, PieceColor::WHITE, rights, NO_SQUARE).empty());
}

TEST_F(ChessRulesTest, LegalityProbeLeavesBoardUntouched) {
    ASSERT_TRUE(board.setFromPlacement("4k3/4r3/8/8/8/8/4B3/4K3"));
    ChessBoard before = board;

    ChessRules(board).generateLegalMoves(PieceColor::WHITE, rights, NO_SQUARE);
    EXPECT_EQ(board, before);
}

TEST_F(ChessRulesTest, WrongSideOrOwnTargetRejected) {
    board = ChessBoard::standard();

    EXPECT_FALSE(legal(E7, E5, PieceColor::WHITE));
    EXPECT_FALSE(legal(D1, D2, PieceColor::WHITE));
    EXPECT_FALSE(legal(E4, E5, PieceColor::WHITE));   // Empty origin
    EXPECT_FALSE(legal(-1, E4, PieceColor::WHITE));
    EXPECT_FALSE(legal(E2, 64, PieceColor::WHITE));
}

TEST_F(ChessRulesTest, CastlingRequirements) {
    ASSERT_TRUE(board.setFromPlacement("r3k2r/8/8/8/8/8/8/R3K2R"));

    EXPECT_TRUE(legal(E1, G1, PieceColor::WHITE));
    EXPECT_TRUE(legal(E1, C1, PieceColor::WHITE));
    EXPECT_TRUE(legal(E8, G8, PieceColor::BLACK));
    EXPECT_TRUE(legal(E8, C8, PieceColor::BLACK));

    // Right revoked
    rights.white_kingside = false;
    EXPECT_FALSE(legal(E1, G1, PieceColor::WHITE));
    EXPECT_TRUE(legal(E1, C1, PieceColor::WHITE));

    // Square between king and rook occupied
    rights = CastlingRights();
    board.setPiece(B1, {PieceType::KNIGHT, PieceColor::WHITE});
    EXPECT_FALSE(legal(E1, C1, PieceColor::WHITE));
}

TEST_F(ChessRulesTest, CastlingThroughOrOutOfCheckRejected) {
    // f1 attacked by the rook on f8
    ASSERT_TRUE(board.setFromPlacement("4kr2/8/8/8/8/8/8/4K2R"));
    EXPECT_FALSE(legal(E1, G1, PieceColor::WHITE));

    // King in check on e1
    ASSERT_TRUE(board.setFromPlacement("4r1k1/8/8/8/8/8/8/4K2R"));
    EXPECT_FALSE(legal(E1, G1, PieceColor::WHITE));

    // Destination attacked
    ASSERT_TRUE(board.setFromPlacement("6rk/8/8/8/8/8/8/4K2R"));
    EXPECT_FALSE(legal(E1, G1, PieceColor::WHITE));
}

TEST_F(ChessRulesTest, CastlingNeedsKingAndRookAtHome) {
    // No rook on h1
    ASSERT_TRUE(board.setFromPlacement("4k3/8/8/8/8/8/8/4K3"));
    EXPECT_FALSE(legal(E1, G1, PieceColor::WHITE));

    // King not on e1
    ASSERT_TRUE(board.setFromPlacement("4k3/8/8/8/8/8/8/3K3R"));
    EXPECT_FALSE(legal(D1, F1, PieceColor::WHITE));
}

TEST_F(ChessRulesTest, EnPassantRequiresTargetAndBypassedPawn) {
    ASSERT_TRUE(board.setFromPlacement("4k3/8/8/3pP3/8/8/8/4K3"));

    EXPECT_TRUE(legal(E5, D6, PieceColor::WHITE, D6));
    EXPECT_FALSE(legal(E5, D6, PieceColor::WHITE, NO_SQUARE));

    // Target set but nothing to capture beside the pawn
    board.clearSquare(D5);
    EXPECT_FALSE(legal(E5, D6, PieceColor::WHITE, D6));
}

TEST_F(ChessRulesTest, EnPassantExposingKingRejected) {
    // Removing both pawns from the fifth rank opens the rook's line to the king
    ASSERT_TRUE(board.setFromPlacement("4k3/8/8/K2pP2r/8/8/8/8"));
    EXPECT_FALSE(legal(E5, D6, PieceColor::WHITE, D6));
}

TEST_F(ChessRulesTest, ApplyMoveRelocatesRookAndRemovesBypassedPawn) {
    ASSERT_TRUE(board.setFromPlacement("4k3/8/8/3pP3/8/8/8/4K2R"));

    ChessBoard castled = ChessRules::applyMove(board, E1, G1, NO_SQUARE);
    EXPECT_EQ(castled.getPiece(G1).type, PieceType::KING);
    EXPECT_EQ(castled.getPiece(F1).type, PieceType::ROOK);
    EXPECT_TRUE(castled.isEmpty(H1));

    ChessBoard captured = ChessRules::applyMove(board, E5, D6, D6);
    EXPECT_EQ(captured.getPiece(D6).type, PieceType::PAWN);
    EXPECT_TRUE(captured.isEmpty(D5));

    // The source board is unchanged
    EXPECT_EQ(board.getPiece(E1).type, PieceType::KING);
    EXPECT_EQ(board.getPiece(D5).type, PieceType::PAWN);
}

TEST_F(ChessRulesTest, CastlingRightsUpdates) {
    Piece king(PieceType::KING, PieceColor::WHITE);
    Piece whiteRook(PieceType::ROOK, PieceColor::WHITE);
    Piece blackRook(PieceType::ROOK, PieceColor::BLACK);
    Piece none;

    CastlingRights afterKing = ChessRules::getUpdatedCastlingRights({E1, E2}, king, none, rights);
    EXPECT_FALSE(afterKing.white_kingside);
    EXPECT_FALSE(afterKing.white_queenside);
    EXPECT_TRUE(afterKing.black_kingside);

    CastlingRights afterRook = ChessRules::getUpdatedCastlingRights({H1, H4}, whiteRook, none, rights);
    EXPECT_FALSE(afterRook.white_kingside);
    EXPECT_TRUE(afterRook.white_queenside);

    CastlingRights afterCapture = ChessRules::getUpdatedCastlingRights({A1, A8}, whiteRook, blackRook, rights);
    EXPECT_FALSE(afterCapture.white_queenside);
    EXPECT_FALSE(afterCapture.black_queenside);
    EXPECT_TRUE(afterCapture.black_kingside);
}

} // namespace chess
} // namespace gambit

#include <gtest/gtest.h>
#include "gambit/games/chess/square.h"
#include "gambit/games/chess/chess_rules.h"

namespace gambit {
namespace chess {

class SquareTest : public ::testing::Test {
};

TEST_F(SquareTest, CornerAndCommonSquares) {
    // Row 0 is rank 8, so a8 is index 0 and h1 is index 63
    EXPECT_EQ(squareFromName("a8").value(), 0);
    EXPECT_EQ(squareFromName("h8").value(), 7);
    EXPECT_EQ(squareFromName("a1").value(), 56);
    EXPECT_EQ(squareFromName("h1").value(), 63);
    EXPECT_EQ(squareFromName("e2").value(), E2);
    EXPECT_EQ(squareFromName("e4").value(), E4);
}

TEST_F(SquareTest, RoundTripAllSquares) {
    for (int square = 0; square < NUM_SQUARES; ++square) {
        auto name = squareToName(square);
        ASSERT_TRUE(name.has_value());

        SquareResult parsed = squareFromName(*name);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(parsed.value(), square);

        SquareResult fromCoords = squareFromCoords(getRank(square), getFile(square));
        ASSERT_TRUE(fromCoords.has_value());
        EXPECT_EQ(fromCoords.value(), square);
    }
}

TEST_F(SquareTest, DistinctErrors) {
    EXPECT_EQ(squareFromName("").error(), SquareError::BAD_LENGTH);
    EXPECT_EQ(squareFromName("e").error(), SquareError::BAD_LENGTH);
    EXPECT_EQ(squareFromName("e22").error(), SquareError::BAD_LENGTH);
    EXPECT_EQ(squareFromName("i1").error(), SquareError::BAD_FILE);
    EXPECT_EQ(squareFromName("E2").error(), SquareError::BAD_FILE);
    EXPECT_EQ(squareFromName("a9").error(), SquareError::BAD_RANK);
    EXPECT_EQ(squareFromName("a0").error(), SquareError::BAD_RANK);

    SquareResult bad = squareFromName("z9");
    EXPECT_FALSE(bad);
    EXPECT_FALSE(bad.message().empty());
}

TEST_F(SquareTest, CoordinatesOutOfRange) {
    EXPECT_EQ(squareFromCoords(8, 0).error(), SquareError::BAD_RANK);
    EXPECT_EQ(squareFromCoords(-1, 0).error(), SquareError::BAD_RANK);
    EXPECT_EQ(squareFromCoords(0, 8).error(), SquareError::BAD_FILE);
    EXPECT_EQ(squareFromCoords(0, -1).error(), SquareError::BAD_FILE);
}

TEST_F(SquareTest, NamesOfInvalidIndices) {
    EXPECT_FALSE(squareToName(-1).has_value());
    EXPECT_FALSE(squareToName(64).has_value());
    EXPECT_EQ(squareName(NO_SQUARE), "-");
    EXPECT_EQ(squareName(E3), "e3");
}

} // namespace chess
} // namespace gambit

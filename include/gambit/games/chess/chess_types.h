// include/gambit/games/chess/chess_types.h
#ifndef GAMBIT_CHESS_TYPES_H
#define GAMBIT_CHESS_TYPES_H

#include <string>

namespace gambit {
namespace chess {

// Board geometry. Square index = row * 8 + column, row 0 is rank 8.
constexpr int BOARD_SIZE = 8;
constexpr int NUM_SQUARES = 64;
constexpr int NO_SQUARE = -1;

/**
 * @brief Kind of a chess piece
 */
enum class PieceType {
    NONE,
    PAWN,
    KNIGHT,
    BISHOP,
    ROOK,
    QUEEN,
    KING
};

/**
 * @brief Side a piece belongs to
 */
enum class PieceColor {
    NONE,
    WHITE,
    BLACK
};

/**
 * @brief Status of a game
 *
 * IN_PROGRESS is the initial state, the other three are terminal.
 */
enum class GameStatus {
    IN_PROGRESS,
    WHITE_WINS,
    BLACK_WINS,
    DRAW_STALEMATE
};

/**
 * @brief A piece value held by one board cell
 *
 * An empty cell holds a piece of type NONE.
 */
struct Piece {
    PieceType type = PieceType::NONE;
    PieceColor color = PieceColor::NONE;
    int square = NO_SQUARE;   // Where the piece currently stands

    Piece() = default;
    Piece(PieceType t, PieceColor c, int sq = NO_SQUARE) : type(t), color(c), square(sq) {}

    bool is_empty() const { return type == PieceType::NONE; }

    // Identity on the board is kind and color, the stored square follows the cell
    bool operator==(const Piece& other) const {
        return type == other.type && color == other.color;
    }
    bool operator!=(const Piece& other) const { return !(*this == other); }
};

/**
 * @brief Castling availability, one flag per color and side
 */
struct CastlingRights {
    bool white_kingside = true;
    bool white_queenside = true;
    bool black_kingside = true;
    bool black_queenside = true;

    bool operator==(const CastlingRights& other) const {
        return white_kingside == other.white_kingside &&
               white_queenside == other.white_queenside &&
               black_kingside == other.black_kingside &&
               black_queenside == other.black_queenside;
    }
    bool operator!=(const CastlingRights& other) const { return !(*this == other); }
};

/**
 * @brief A from-to move with an optional promotion choice
 */
struct ChessMove {
    int from_square = NO_SQUARE;
    int to_square = NO_SQUARE;
    PieceType promotion_piece = PieceType::NONE;

    bool operator==(const ChessMove& other) const {
        return from_square == other.from_square &&
               to_square == other.to_square &&
               promotion_piece == other.promotion_piece;
    }
    bool operator!=(const ChessMove& other) const { return !(*this == other); }
};

/**
 * @brief One executed move as kept in the history
 */
struct MoveRecord {
    int from_square = NO_SQUARE;
    int to_square = NO_SQUARE;
    Piece piece;                                   // The piece that moved, before promotion
    PieceType promotion_piece = PieceType::NONE;   // Set when the move promoted
};

/**
 * @brief Result of a move attempt
 */
struct MoveOutcome {
    bool success = false;
    std::string message;
};

// Outcome messages
extern const char* const MSG_MOVE_SUCCESSFUL;
extern const char* const MSG_ILLEGAL_MOVE;
extern const char* const MSG_GAME_OVER;

inline int getRank(int square) { return square / BOARD_SIZE; }
inline int getFile(int square) { return square % BOARD_SIZE; }
inline int getSquare(int row, int col) { return row * BOARD_SIZE + col; }
inline bool isOnBoard(int row, int col) {
    return row >= 0 && row < BOARD_SIZE && col >= 0 && col < BOARD_SIZE;
}
inline bool isValidSquare(int square) { return square >= 0 && square < NUM_SQUARES; }

inline PieceColor oppositeColor(PieceColor color) {
    return color == PieceColor::WHITE ? PieceColor::BLACK : PieceColor::WHITE;
}

/**
 * @brief One-letter symbol of a piece, uppercase for White
 *
 * @return '.' for an empty piece
 */
char pieceSymbol(const Piece& piece);

/**
 * @brief Parse a one-letter piece symbol
 *
 * @return Empty piece if the letter is not a piece symbol
 */
Piece pieceFromSymbol(char symbol);

/**
 * @brief Parse a promotion letter (q, r, b, n, any case)
 *
 * @return PieceType::NONE if the letter is not a promotion choice
 */
PieceType promotionFromChar(char c);

std::string colorName(PieceColor color);
std::string statusToString(GameStatus status);

} // namespace chess
} // namespace gambit

#endif // GAMBIT_CHESS_TYPES_H

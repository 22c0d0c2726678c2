// include/gambit/games/chess/piece_moves.h
#ifndef GAMBIT_PIECE_MOVES_H
#define GAMBIT_PIECE_MOVES_H

#include "gambit/games/chess/chess_board.h"
#include <vector>
#include <utility>

namespace gambit {
namespace chess {

// (row, column) offsets shared by move generation and attack detection
extern const std::vector<std::pair<int, int>> KNIGHT_MOVES;
extern const std::vector<std::pair<int, int>> KING_MOVES;
extern const std::vector<std::pair<int, int>> BISHOP_DIRECTIONS;
extern const std::vector<std::pair<int, int>> ROOK_DIRECTIONS;
extern const std::vector<std::pair<int, int>> QUEEN_DIRECTIONS;

/**
 * @brief Row a pawn of the given color advances toward (-1 White, +1 Black)
 */
inline int pawnDirection(PieceColor color) {
    return color == PieceColor::WHITE ? -1 : 1;
}

/**
 * @brief Row the pawns of a color start on
 */
inline int pawnHomeRow(PieceColor color) {
    return color == PieceColor::WHITE ? 6 : 1;
}

/**
 * @brief Row on which a pawn of the given color promotes
 */
inline int promotionRow(PieceColor color) {
    return color == PieceColor::WHITE ? 0 : BOARD_SIZE - 1;
}

/**
 * @brief Pseudo-legal destinations of the piece standing on a square
 *
 * Applies the movement pattern of the piece's kind without regard to the
 * safety of its own king. Castling, en passant and promotion are not
 * produced here.
 *
 * @param board Board to read
 * @param square Square of the moving piece
 * @return Destination squares in generation order, empty for an empty square
 */
std::vector<int> pseudoLegalDestinations(const ChessBoard& board, int square);

// Per-kind patterns, each appending to moves
void addPawnMoves(const ChessBoard& board, const Piece& piece, std::vector<int>& moves);
void addKnightMoves(const ChessBoard& board, const Piece& piece, std::vector<int>& moves);
void addKingMoves(const ChessBoard& board, const Piece& piece, std::vector<int>& moves);
void addSlidingMoves(const ChessBoard& board, const Piece& piece,
                     const std::vector<std::pair<int, int>>& directions,
                     std::vector<int>& moves);

} // namespace chess
} // namespace gambit

#endif // GAMBIT_PIECE_MOVES_H

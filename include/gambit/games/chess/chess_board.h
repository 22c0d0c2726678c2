// include/gambit/games/chess/chess_board.h
#ifndef GAMBIT_CHESS_BOARD_H
#define GAMBIT_CHESS_BOARD_H

#include "gambit/games/chess/chess_types.h"
#include <array>
#include <string>

namespace gambit {
namespace chess {

/**
 * @brief 8x8 grid of piece cells
 *
 * The board is a plain value: copying it copies all 64 cells, so a copy can
 * be modified freely without touching the source board.
 */
class ChessBoard {
public:
    ChessBoard() = default;

    /**
     * @brief Board with the standard initial arrangement
     */
    static ChessBoard standard();

    /**
     * @brief Get the piece on a square
     *
     * @param square Square index
     * @return Piece on the square, empty piece if the square is empty or off the board
     */
    Piece getPiece(int square) const;

    /**
     * @brief Put a piece on a square, updating the piece's stored square
     */
    void setPiece(int square, Piece piece);

    /**
     * @brief Empty a square
     */
    void clearSquare(int square);

    /**
     * @brief Move whatever stands on from to to, emptying from
     *
     * @return The piece that stood on to before the move (empty if none)
     */
    Piece movePiece(int from, int to);

    bool isEmpty(int square) const { return getPiece(square).is_empty(); }

    /**
     * @brief Find the king of a color
     *
     * @return Square of the king, NO_SQUARE if there is none
     */
    int findKing(PieceColor color) const;

    int countPieces(PieceType type, PieceColor color) const;

    /**
     * @brief Load the piece-placement field of a FEN string
     *
     * The board is left empty on failure. A placement with more than one king
     * of a color is rejected.
     *
     * @param placement Ranks from 8 to 1 separated by '/'
     * @return true if the placement was valid
     */
    bool setFromPlacement(const std::string& placement);

    /**
     * @brief Piece-placement field of the current board
     */
    std::string toPlacement() const;

    void clear();

    bool operator==(const ChessBoard& other) const { return cells_ == other.cells_; }
    bool operator!=(const ChessBoard& other) const { return !(*this == other); }

private:
    std::array<Piece, NUM_SQUARES> cells_;
};

} // namespace chess
} // namespace gambit

#endif // GAMBIT_CHESS_BOARD_H

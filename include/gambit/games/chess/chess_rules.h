// include/gambit/games/chess/chess_rules.h
#ifndef GAMBIT_CHESS_RULES_H
#define GAMBIT_CHESS_RULES_H

#include "gambit/games/chess/chess_board.h"
#include <vector>
#include <utility>

namespace gambit {
namespace chess {

// Square constants, row 0 is rank 8
constexpr int A1 = 56, B1 = 57, C1 = 58, D1 = 59, E1 = 60, F1 = 61, G1 = 62, H1 = 63;
constexpr int A2 = 48, B2 = 49, C2 = 50, D2 = 51, E2 = 52, F2 = 53, G2 = 54, H2 = 55;
constexpr int A3 = 40, B3 = 41, C3 = 42, D3 = 43, E3 = 44, F3 = 45, G3 = 46, H3 = 47;
constexpr int A4 = 32, B4 = 33, C4 = 34, D4 = 35, E4 = 36, F4 = 37, G4 = 38, H4 = 39;
constexpr int A5 = 24, B5 = 25, C5 = 26, D5 = 27, E5 = 28, F5 = 29, G5 = 30, H5 = 31;
constexpr int A6 = 16, B6 = 17, C6 = 18, D6 = 19, E6 = 20, F6 = 21, G6 = 22, H6 = 23;
constexpr int A7 = 8, B7 = 9, C7 = 10, D7 = 11, E7 = 12, F7 = 13, G7 = 14, H7 = 15;
constexpr int A8 = 0, B8 = 1, C8 = 2, D8 = 3, E8 = 4, F8 = 5, G8 = 6, H8 = 7;

/**
 * @brief Rules implementation for chess over a read-only board
 *
 * A ChessRules object only borrows the board it was built on. Legality probes
 * never modify that board: each candidate move is applied to a copy, the copy
 * is tested for check, and the copy is discarded.
 */
class ChessRules {
public:
    /**
     * @brief Constructor
     *
     * @param board Board to evaluate; must outlive this object
     */
    explicit ChessRules(const ChessBoard& board);

    /**
     * @brief Check if a square is attacked by a player
     *
     * @param square Square index
     * @param by_color Color of the attacker
     * @return true if attacked, false otherwise
     */
    bool isSquareAttacked(int square, PieceColor by_color) const;

    /**
     * @brief Check if a color's king is attacked
     *
     * A board without a king of that color counts as being in check.
     *
     * @param color Color to check for
     * @return true if in check, false otherwise
     */
    bool isInCheck(PieceColor color) const;

    /**
     * @brief Check if a move is legal
     *
     * @param from Origin square
     * @param to Destination square
     * @param current_player Side to move
     * @param castling_rights Current castling rights
     * @param en_passant_square Current en passant target (NO_SQUARE if none)
     * @return true if legal, false otherwise
     */
    bool isLegalMove(
        int from,
        int to,
        PieceColor current_player,
        const CastlingRights& castling_rights,
        int en_passant_square) const;

    /**
     * @brief Generate all legal moves of a side
     *
     * Moves are ordered by origin square, then destination square.
     *
     * @param current_player Side to move
     * @param castling_rights Current castling rights
     * @param en_passant_square Current en passant target
     * @return Vector of legal moves, promotion left unset
     */
    std::vector<ChessMove> generateLegalMoves(
        PieceColor current_player,
        const CastlingRights& castling_rights,
        int en_passant_square) const;

    /**
     * @brief Legal destinations of the piece on one square, ascending
     */
    std::vector<int> legalDestinations(
        int from,
        PieceColor current_player,
        const CastlingRights& castling_rights,
        int en_passant_square) const;

    /**
     * @brief Whether from-to is a king stepping two files along its rank
     */
    bool isCastlingPattern(int from, int to) const;

    /**
     * @brief Whether from-to is a pawn capturing en passant onto the target
     */
    bool isEnPassantPattern(int from, int to, int en_passant_square) const;

    /**
     * @brief Board after a move, including rook relocation and en passant removal
     *
     * Promotion is not applied. The input board is not modified.
     */
    static ChessBoard applyMove(const ChessBoard& board, int from, int to, int en_passant_square);

    /**
     * @brief Get updated castling rights after a move
     *
     * @param move The executed move
     * @param piece The piece that moved
     * @param captured Captured piece (if any)
     * @param current_rights Current castling rights
     * @return Updated castling rights
     */
    static CastlingRights getUpdatedCastlingRights(
        const ChessMove& move,
        const Piece& piece,
        const Piece& captured,
        const CastlingRights& current_rights);

    /**
     * @brief Squares the rook of a castle moves between
     *
     * @return (rook origin, rook destination) for a king move from-to
     */
    static std::pair<int, int> getCastlingRookSquares(int king_from, int king_to);

private:
    const ChessBoard& board_;

    bool isRuleLegal(int from, int to, PieceColor current_player,
                     const CastlingRights& castling_rights, int en_passant_square) const;
    bool isValidCastle(int from, int to, PieceColor current_player,
                       const CastlingRights& castling_rights) const;
    bool isValidEnPassant(int from, int to, PieceColor current_player, int en_passant_square) const;
    bool moveExposesKing(int from, int to, PieceColor current_player, int en_passant_square) const;

    // Candidate destinations worth probing for the piece on from
    std::vector<int> candidateDestinations(int from, int en_passant_square) const;
};

} // namespace chess
} // namespace gambit

#endif // GAMBIT_CHESS_RULES_H

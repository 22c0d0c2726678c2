// include/gambit/games/chess/chess_state.h
#ifndef GAMBIT_CHESS_STATE_H
#define GAMBIT_CHESS_STATE_H

#include "gambit/games/chess/chess_types.h"
#include "gambit/games/chess/chess_board.h"
#include "gambit/games/chess/chess_rules.h"
#include <memory>
#include <string>
#include <vector>

namespace gambit {
namespace chess {

/**
 * @brief Complete state of a chess game
 *
 * Owns the board, the side to move, castling rights, the en passant target,
 * the move history, the captured-piece ledgers and the game status. The
 * state changes only through makeMove(); every member is held by value, so a
 * copy (or clone()) shares nothing with the state it came from.
 */
class ChessState {
public:
    static const char* const STARTING_FEN;

    /**
     * @brief Constructor
     *
     * @param fen Starting position. Empty for the standard position. Only the
     *            placement field is required; side to move, castling rights,
     *            en passant target and counters are read when present. An
     *            invalid string falls back to the standard position.
     */
    explicit ChessState(const std::string& fen = "");

    ChessState(const ChessState& other) = default;
    ChessState& operator=(const ChessState& other) = default;

    /**
     * @brief Deep copy of the state
     */
    std::unique_ptr<ChessState> clone() const;

    /**
     * @brief Replace the position from a FEN string
     *
     * History, ledgers and status are reset. On failure the state is left
     * with an empty board and should not be used.
     *
     * @return true if the string was valid
     */
    bool setFromFEN(const std::string& fen);

    /**
     * @brief FEN string of the current position
     */
    std::string toFEN() const;

    // Board queries
    const ChessBoard& getBoard() const { return board_; }
    Piece getPiece(int square) const { return board_.getPiece(square); }
    PieceColor getCurrentPlayer() const { return current_player_; }
    GameStatus getStatus() const { return status_; }
    bool isTerminal() const { return status_ != GameStatus::IN_PROGRESS; }
    CastlingRights getCastlingRights() const { return castling_rights_; }
    int getEnPassantSquare() const { return en_passant_square_; }
    int getHalfmoveClock() const { return halfmove_clock_; }
    int getFullmoveNumber() const { return fullmove_number_; }
    const std::vector<MoveRecord>& getMoveHistory() const { return move_history_; }

    /**
     * @brief Kinds captured by a color, in capture order
     *
     * @param capturer WHITE for the black pieces White has taken, and vice versa
     */
    const std::vector<PieceType>& getCaptured(PieceColor capturer) const;

    /**
     * @brief Captured pieces as symbols, e.g. "pnq" for black pieces taken by White
     */
    std::string capturedSymbols(PieceColor capturer) const;

    // Rules
    bool isLegalMove(int from, int to) const;
    bool isLegalMove(const std::string& from, const std::string& to) const;

    /**
     * @brief All legal moves of a color
     *
     * Empty when color is not the side to move.
     */
    std::vector<ChessMove> getAllLegalMoves(PieceColor color) const;

    /**
     * @brief Legal destination squares of the piece on a square
     */
    std::vector<int> getLegalDestinations(int square) const;

    bool isInCheck(PieceColor color) const;
    bool isSquareAttacked(int square, PieceColor by_color) const;

    /**
     * @brief Attempt a move given algebraic square names
     *
     * @param from Origin, e.g. "e2"
     * @param to Destination, e.g. "e4"
     * @param promotion Promotion letter (q, r, b, n); anything else means queen
     * @return Success flag and message
     */
    MoveOutcome makeMove(const std::string& from, const std::string& to, char promotion = '\0');

    /**
     * @brief Attempt a move
     *
     * Nothing is changed when the move is rejected.
     */
    MoveOutcome makeMove(const ChessMove& move);

    /**
     * @brief Text diagram of the board with side to move and rights
     */
    std::string toString() const;

    /**
     * @brief Check exactly one king per color stands on the board
     */
    bool validate() const;

    bool equals(const ChessState& other) const;

private:
    ChessBoard board_;
    PieceColor current_player_;
    CastlingRights castling_rights_;
    int en_passant_square_;
    int halfmove_clock_;
    int fullmove_number_;
    GameStatus status_;
    std::vector<MoveRecord> move_history_;
    std::vector<PieceType> captured_by_white_;   // Black pieces taken by White
    std::vector<PieceType> captured_by_black_;   // White pieces taken by Black

    // Legal moves of the side to move
    mutable std::vector<ChessMove> cached_legal_moves_;
    mutable bool legal_moves_dirty_;

    void initializeStartingPosition();
    void resetGameRecord();
    void invalidateCache();
    void updateStatus();
    const std::vector<ChessMove>& currentLegalMoves() const;
};

} // namespace chess
} // namespace gambit

#endif // GAMBIT_CHESS_STATE_H

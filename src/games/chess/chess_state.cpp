// src/games/chess/chess_state.cpp
#include "gambit/games/chess/chess_state.h"
#include "gambit/games/chess/piece_moves.h"
#include "gambit/games/chess/square.h"
#include <spdlog/spdlog.h>
#include <sstream>
#include <cstdlib>
#include <stdexcept>

namespace gambit {
namespace chess {

const char* const ChessState::STARTING_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

namespace {

bool parseCounter(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    try {
        out = std::stoi(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

// Constructor
ChessState::ChessState(const std::string& fen)
    : current_player_(PieceColor::WHITE),
      en_passant_square_(NO_SQUARE),
      halfmove_clock_(0),
      fullmove_number_(1),
      status_(GameStatus::IN_PROGRESS),
      legal_moves_dirty_(true)
{
    if (fen.empty()) {
        initializeStartingPosition();
        return;
    }

    if (!setFromFEN(fen)) {
        spdlog::warn("ChessState: Invalid starting position '{}', using the standard position", fen);
        initializeStartingPosition();
    }
}

std::unique_ptr<ChessState> ChessState::clone() const {
    return std::make_unique<ChessState>(*this);
}

void ChessState::initializeStartingPosition() {
    board_ = ChessBoard::standard();
    current_player_ = PieceColor::WHITE;
    castling_rights_ = CastlingRights();
    en_passant_square_ = NO_SQUARE;
    halfmove_clock_ = 0;
    fullmove_number_ = 1;
    resetGameRecord();
}

void ChessState::resetGameRecord() {
    status_ = GameStatus::IN_PROGRESS;
    move_history_.clear();
    captured_by_white_.clear();
    captured_by_black_.clear();
    invalidateCache();
}

bool ChessState::setFromFEN(const std::string& fen) {
    std::istringstream ss(fen);
    std::string boardPos, activeColor, castlingAvailability, enPassantTarget, halfmoveClock, fullmoveNumber;

    // Defaults for every field after the placement
    current_player_ = PieceColor::WHITE;
    castling_rights_ = CastlingRights();
    en_passant_square_ = NO_SQUARE;
    halfmove_clock_ = 0;
    fullmove_number_ = 1;
    resetGameRecord();

    // Parse board position
    if (!(ss >> boardPos) || !board_.setFromPlacement(boardPos)) {
        return false;
    }

    // Parse active color
    if (ss >> activeColor) {
        if (activeColor == "w") {
            current_player_ = PieceColor::WHITE;
        } else if (activeColor == "b") {
            current_player_ = PieceColor::BLACK;
        } else {
            board_.clear();
            return false;
        }
    }

    // Parse castling availability
    if (ss >> castlingAvailability) {
        castling_rights_ = {false, false, false, false};
        if (castlingAvailability != "-") {
            for (char c : castlingAvailability) {
                switch (c) {
                    case 'K': castling_rights_.white_kingside = true; break;
                    case 'Q': castling_rights_.white_queenside = true; break;
                    case 'k': castling_rights_.black_kingside = true; break;
                    case 'q': castling_rights_.black_queenside = true; break;
                    default:
                        board_.clear();
                        return false;
                }
            }
        }
    }

    // Parse en passant target square
    if (ss >> enPassantTarget) {
        if (enPassantTarget != "-") {
            SquareResult target = squareFromName(enPassantTarget);
            if (!target) {
                board_.clear();
                return false;
            }
            en_passant_square_ = target.value();
        }
    }

    // Counters are optional and only echoed back by toFEN()
    if (ss >> halfmoveClock) {
        if (!parseCounter(halfmoveClock, halfmove_clock_)) {
            board_.clear();
            return false;
        }
    }
    if (ss >> fullmoveNumber) {
        if (!parseCounter(fullmoveNumber, fullmove_number_)) {
            board_.clear();
            return false;
        }
    }

    invalidateCache();
    updateStatus();
    return true;
}

std::string ChessState::toFEN() const {
    std::stringstream ss;

    ss << board_.toPlacement();
    ss << ' ' << (current_player_ == PieceColor::WHITE ? 'w' : 'b');

    // Castling availability
    ss << ' ';
    bool hasCastling = false;
    if (castling_rights_.white_kingside) { ss << 'K'; hasCastling = true; }
    if (castling_rights_.white_queenside) { ss << 'Q'; hasCastling = true; }
    if (castling_rights_.black_kingside) { ss << 'k'; hasCastling = true; }
    if (castling_rights_.black_queenside) { ss << 'q'; hasCastling = true; }
    if (!hasCastling) {
        ss << '-';
    }

    ss << ' ' << squareName(en_passant_square_);
    ss << ' ' << halfmove_clock_;
    ss << ' ' << fullmove_number_;

    return ss.str();
}

const std::vector<PieceType>& ChessState::getCaptured(PieceColor capturer) const {
    return capturer == PieceColor::WHITE ? captured_by_white_ : captured_by_black_;
}

std::string ChessState::capturedSymbols(PieceColor capturer) const {
    std::string symbols;
    for (PieceType type : getCaptured(capturer)) {
        symbols += pieceSymbol(Piece(type, oppositeColor(capturer)));
    }
    return symbols;
}

bool ChessState::isLegalMove(int from, int to) const {
    return ChessRules(board_).isLegalMove(from, to, current_player_, castling_rights_, en_passant_square_);
}

bool ChessState::isLegalMove(const std::string& from, const std::string& to) const {
    SquareResult fromSquare = squareFromName(from);
    SquareResult toSquare = squareFromName(to);
    if (!fromSquare || !toSquare) {
        return false;
    }
    return isLegalMove(fromSquare.value(), toSquare.value());
}

std::vector<ChessMove> ChessState::getAllLegalMoves(PieceColor color) const {
    if (color != current_player_) {
        return {};
    }
    return currentLegalMoves();
}

std::vector<int> ChessState::getLegalDestinations(int square) const {
    std::vector<int> destinations;
    for (const ChessMove& move : currentLegalMoves()) {
        if (move.from_square == square) {
            destinations.push_back(move.to_square);
        }
    }
    return destinations;
}

bool ChessState::isInCheck(PieceColor color) const {
    return ChessRules(board_).isInCheck(color);
}

bool ChessState::isSquareAttacked(int square, PieceColor by_color) const {
    return ChessRules(board_).isSquareAttacked(square, by_color);
}

MoveOutcome ChessState::makeMove(const std::string& from, const std::string& to, char promotion) {
    if (status_ != GameStatus::IN_PROGRESS) {
        return {false, MSG_GAME_OVER};
    }

    SquareResult fromSquare = squareFromName(from);
    if (!fromSquare) {
        return {false, "Invalid square coordinates: '" + from + "': " + fromSquare.message()};
    }
    SquareResult toSquare = squareFromName(to);
    if (!toSquare) {
        return {false, "Invalid square coordinates: '" + to + "': " + toSquare.message()};
    }

    return makeMove(ChessMove{fromSquare.value(), toSquare.value(), promotionFromChar(promotion)});
}

MoveOutcome ChessState::makeMove(const ChessMove& move) {
    if (status_ != GameStatus::IN_PROGRESS) {
        return {false, MSG_GAME_OVER};
    }

    if (!isLegalMove(move.from_square, move.to_square)) {
        spdlog::debug("ChessState: Rejected {}{} for {}",
                      squareName(move.from_square), squareName(move.to_square), colorName(current_player_));
        return {false, MSG_ILLEGAL_MOVE};
    }

    ChessRules rules(board_);
    bool enPassant = rules.isEnPassantPattern(move.from_square, move.to_square, en_passant_square_);
    bool castle = rules.isCastlingPattern(move.from_square, move.to_square);

    Piece piece = board_.getPiece(move.from_square);
    Piece captured = board_.getPiece(move.to_square);

    // The bypassed pawn goes before the destination is overwritten
    if (enPassant) {
        int capturedPawnSquare = getSquare(getRank(move.from_square), getFile(move.to_square));
        captured = board_.getPiece(capturedPawnSquare);
        board_.clearSquare(capturedPawnSquare);
    }

    en_passant_square_ = NO_SQUARE;
    board_.movePiece(move.from_square, move.to_square);

    if (piece.type == PieceType::PAWN && std::abs(getRank(move.to_square) - getRank(move.from_square)) == 2) {
        int epRank = (getRank(move.from_square) + getRank(move.to_square)) / 2;
        en_passant_square_ = getSquare(epRank, getFile(move.from_square));
    }

    if (castle) {
        auto [rookFrom, rookTo] = ChessRules::getCastlingRookSquares(move.from_square, move.to_square);
        board_.movePiece(rookFrom, rookTo);
    }

    castling_rights_ = ChessRules::getUpdatedCastlingRights(move, piece, captured, castling_rights_);

    MoveRecord record;
    record.from_square = move.from_square;
    record.to_square = move.to_square;
    record.piece = piece;

    // A pawn on the far rank is replaced by a new piece
    if (piece.type == PieceType::PAWN && getRank(move.to_square) == promotionRow(piece.color)) {
        PieceType promoted = move.promotion_piece;
        if (promoted != PieceType::QUEEN && promoted != PieceType::ROOK &&
            promoted != PieceType::BISHOP && promoted != PieceType::KNIGHT) {
            promoted = PieceType::QUEEN;
        }
        board_.setPiece(move.to_square, Piece(promoted, piece.color));
        record.promotion_piece = promoted;
    }

    move_history_.push_back(record);

    if (piece.type == PieceType::PAWN || !captured.is_empty()) {
        halfmove_clock_ = 0;
    } else {
        halfmove_clock_++;
    }

    invalidateCache();

    if (!captured.is_empty()) {
        (current_player_ == PieceColor::WHITE ? captured_by_white_ : captured_by_black_).push_back(captured.type);

        // Only reachable from a corrupted position: the side not on move was left in check
        if (captured.type == PieceType::KING) {
            status_ = current_player_ == PieceColor::WHITE ? GameStatus::WHITE_WINS : GameStatus::BLACK_WINS;
            spdlog::warn("ChessState: King captured on {}, {}", squareName(move.to_square), statusToString(status_));
            return {true, MSG_MOVE_SUCCESSFUL};
        }
    }

    if (current_player_ == PieceColor::BLACK) {
        fullmove_number_++;
    }
    current_player_ = oppositeColor(current_player_);

    updateStatus();

    return {true, MSG_MOVE_SUCCESSFUL};
}

void ChessState::updateStatus() {
    if (!currentLegalMoves().empty()) {
        return;
    }

    if (isInCheck(current_player_)) {
        status_ = current_player_ == PieceColor::WHITE ? GameStatus::BLACK_WINS : GameStatus::WHITE_WINS;
    } else {
        status_ = GameStatus::DRAW_STALEMATE;
    }
    spdlog::info("ChessState: Game over after {} moves: {}", move_history_.size(), statusToString(status_));
}

const std::vector<ChessMove>& ChessState::currentLegalMoves() const {
    if (legal_moves_dirty_) {
        cached_legal_moves_ = ChessRules(board_).generateLegalMoves(
            current_player_, castling_rights_, en_passant_square_);
        legal_moves_dirty_ = false;
    }
    return cached_legal_moves_;
}

void ChessState::invalidateCache() {
    legal_moves_dirty_ = true;
}

std::string ChessState::toString() const {
    std::stringstream ss;

    ss << "  a b c d e f g h" << std::endl;
    for (int rank = 0; rank < BOARD_SIZE; ++rank) {
        ss << (8 - rank) << " ";
        for (int file = 0; file < BOARD_SIZE; ++file) {
            ss << pieceSymbol(board_.getPiece(getSquare(rank, file))) << " ";
        }
        ss << (8 - rank) << std::endl;
    }
    ss << "  a b c d e f g h" << std::endl;

    ss << "Current player: " << colorName(current_player_) << std::endl;
    ss << "Status: " << statusToString(status_) << std::endl;
    ss << "En passant square: " << squareName(en_passant_square_) << std::endl;
    ss << "FEN: " << toFEN() << std::endl;

    return ss.str();
}

bool ChessState::validate() const {
    return board_.countPieces(PieceType::KING, PieceColor::WHITE) == 1 &&
           board_.countPieces(PieceType::KING, PieceColor::BLACK) == 1;
}

bool ChessState::equals(const ChessState& other) const {
    return board_ == other.board_ &&
           current_player_ == other.current_player_ &&
           castling_rights_ == other.castling_rights_ &&
           en_passant_square_ == other.en_passant_square_ &&
           status_ == other.status_;
}

} // namespace chess
} // namespace gambit

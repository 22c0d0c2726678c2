// src/games/chess/chess_rules.cpp
#include "gambit/games/chess/chess_rules.h"
#include "gambit/games/chess/piece_moves.h"
#include <algorithm>
#include <cstdlib>

namespace gambit {
namespace chess {

namespace {

int homeKingSquare(PieceColor color) {
    return color == PieceColor::WHITE ? E1 : E8;
}

} // namespace

ChessRules::ChessRules(const ChessBoard& board)
    : board_(board) {
}

bool ChessRules::isSquareAttacked(int square, PieceColor by_color) const {
    int rank = getRank(square);
    int file = getFile(square);

    // Pawns attack diagonally toward their direction of travel, so look one
    // row back from the target along the attacker's direction
    int pawnRank = rank - pawnDirection(by_color);
    for (int fileOffset : {-1, 1}) {
        int attackFile = file + fileOffset;
        if (isOnBoard(pawnRank, attackFile)) {
            Piece attacker = board_.getPiece(getSquare(pawnRank, attackFile));
            if (attacker.type == PieceType::PAWN && attacker.color == by_color) {
                return true;
            }
        }
    }

    // Check for knight attacks
    for (const auto& [rankOffset, fileOffset] : KNIGHT_MOVES) {
        int attackRank = rank + rankOffset;
        int attackFile = file + fileOffset;

        if (isOnBoard(attackRank, attackFile)) {
            Piece attacker = board_.getPiece(getSquare(attackRank, attackFile));
            if (attacker.type == PieceType::KNIGHT && attacker.color == by_color) {
                return true;
            }
        }
    }

    // Check for king attacks
    for (const auto& [rankOffset, fileOffset] : KING_MOVES) {
        int attackRank = rank + rankOffset;
        int attackFile = file + fileOffset;

        if (isOnBoard(attackRank, attackFile)) {
            Piece attacker = board_.getPiece(getSquare(attackRank, attackFile));
            if (attacker.type == PieceType::KING && attacker.color == by_color) {
                return true;
            }
        }
    }

    // Sliding pieces: the first blocker on a ray decides
    for (const auto& [rankDir, fileDir] : QUEEN_DIRECTIONS) {
        bool diagonal = rankDir != 0 && fileDir != 0;

        for (int step = 1; ; ++step) {
            int attackRank = rank + rankDir * step;
            int attackFile = file + fileDir * step;

            if (!isOnBoard(attackRank, attackFile)) {
                break;  // Off the board
            }

            Piece attacker = board_.getPiece(getSquare(attackRank, attackFile));
            if (attacker.is_empty()) {
                continue;
            }

            if (attacker.color == by_color) {
                if (attacker.type == PieceType::QUEEN) {
                    return true;
                }
                if (diagonal && attacker.type == PieceType::BISHOP) {
                    return true;
                }
                if (!diagonal && attacker.type == PieceType::ROOK) {
                    return true;
                }
            }
            break;  // Piece blocks further attacks in this direction
        }
    }

    return false;
}

bool ChessRules::isInCheck(PieceColor color) const {
    int kingSquare = board_.findKing(color);
    if (kingSquare == NO_SQUARE) {
        return true;  // A side without a king can never be safe
    }

    return isSquareAttacked(kingSquare, oppositeColor(color));
}

bool ChessRules::isLegalMove(
    int from,
    int to,
    PieceColor current_player,
    const CastlingRights& castling_rights,
    int en_passant_square) const {

    if (!isValidSquare(from) || !isValidSquare(to)) {
        return false;
    }

    Piece piece = board_.getPiece(from);
    if (piece.is_empty() || piece.color != current_player) {
        return false;
    }

    Piece target = board_.getPiece(to);
    if (!target.is_empty() && target.color == current_player) {
        return false;
    }

    if (!isRuleLegal(from, to, current_player, castling_rights, en_passant_square)) {
        return false;
    }

    return !moveExposesKing(from, to, current_player, en_passant_square);
}

std::vector<ChessMove> ChessRules::generateLegalMoves(
    PieceColor current_player,
    const CastlingRights& castling_rights,
    int en_passant_square) const {

    std::vector<ChessMove> legalMoves;

    for (int from = 0; from < NUM_SQUARES; ++from) {
        Piece piece = board_.getPiece(from);
        if (piece.is_empty() || piece.color != current_player) {
            continue;
        }

        for (int to : legalDestinations(from, current_player, castling_rights, en_passant_square)) {
            legalMoves.push_back({from, to});
        }
    }

    return legalMoves;
}

std::vector<int> ChessRules::legalDestinations(
    int from,
    PieceColor current_player,
    const CastlingRights& castling_rights,
    int en_passant_square) const {

    std::vector<int> destinations;
    for (int to : candidateDestinations(from, en_passant_square)) {
        if (isLegalMove(from, to, current_player, castling_rights, en_passant_square)) {
            destinations.push_back(to);
        }
    }
    return destinations;
}

bool ChessRules::isCastlingPattern(int from, int to) const {
    Piece piece = board_.getPiece(from);
    return piece.type == PieceType::KING &&
           isValidSquare(to) &&
           getRank(from) == getRank(to) &&
           std::abs(getFile(to) - getFile(from)) == 2;
}

bool ChessRules::isEnPassantPattern(int from, int to, int en_passant_square) const {
    if (en_passant_square == NO_SQUARE || to != en_passant_square) {
        return false;
    }

    Piece piece = board_.getPiece(from);
    if (piece.type != PieceType::PAWN || !board_.isEmpty(to)) {
        return false;
    }

    return getRank(to) - getRank(from) == pawnDirection(piece.color) &&
           std::abs(getFile(to) - getFile(from)) == 1;
}

ChessBoard ChessRules::applyMove(const ChessBoard& board, int from, int to, int en_passant_square) {
    ChessBoard next = board;
    ChessRules rules(board);

    if (rules.isEnPassantPattern(from, to, en_passant_square)) {
        next.clearSquare(getSquare(getRank(from), getFile(to)));
    }

    bool castle = rules.isCastlingPattern(from, to);
    next.movePiece(from, to);

    if (castle) {
        auto [rookFrom, rookTo] = getCastlingRookSquares(from, to);
        next.movePiece(rookFrom, rookTo);
    }

    return next;
}

CastlingRights ChessRules::getUpdatedCastlingRights(
    const ChessMove& move,
    const Piece& piece,
    const Piece& captured,
    const CastlingRights& current_rights) {

    CastlingRights updated_rights = current_rights;

    // Any king move gives up both sides
    if (piece.type == PieceType::KING) {
        if (piece.color == PieceColor::WHITE) {
            updated_rights.white_kingside = false;
            updated_rights.white_queenside = false;
        } else {
            updated_rights.black_kingside = false;
            updated_rights.black_queenside = false;
        }
    }

    // A rook leaving its home corner
    if (piece.type == PieceType::ROOK) {
        if (piece.color == PieceColor::WHITE) {
            if (move.from_square == A1) updated_rights.white_queenside = false;
            if (move.from_square == H1) updated_rights.white_kingside = false;
        } else {
            if (move.from_square == A8) updated_rights.black_queenside = false;
            if (move.from_square == H8) updated_rights.black_kingside = false;
        }
    }

    // A rook captured on its home corner
    if (captured.type == PieceType::ROOK) {
        if (captured.color == PieceColor::WHITE) {
            if (move.to_square == A1) updated_rights.white_queenside = false;
            if (move.to_square == H1) updated_rights.white_kingside = false;
        } else {
            if (move.to_square == A8) updated_rights.black_queenside = false;
            if (move.to_square == H8) updated_rights.black_kingside = false;
        }
    }

    return updated_rights;
}

std::pair<int, int> ChessRules::getCastlingRookSquares(int king_from, int king_to) {
    int rank = getRank(king_from);
    bool isKingside = getFile(king_to) > getFile(king_from);

    if (isKingside) {
        return {getSquare(rank, 7), getSquare(rank, 5)};
    }
    return {getSquare(rank, 0), getSquare(rank, 3)};
}

bool ChessRules::isRuleLegal(int from, int to, PieceColor current_player,
                             const CastlingRights& castling_rights, int en_passant_square) const {
    std::vector<int> pseudo = pseudoLegalDestinations(board_, from);
    if (std::find(pseudo.begin(), pseudo.end(), to) != pseudo.end()) {
        return true;
    }

    if (isCastlingPattern(from, to)) {
        return isValidCastle(from, to, current_player, castling_rights);
    }

    return isValidEnPassant(from, to, current_player, en_passant_square);
}

bool ChessRules::isValidCastle(int from, int to, PieceColor current_player,
                               const CastlingRights& castling_rights) const {
    if (from != homeKingSquare(current_player)) {
        return false;
    }

    bool isKingside = getFile(to) > getFile(from);
    bool hasRight;
    if (current_player == PieceColor::WHITE) {
        hasRight = isKingside ? castling_rights.white_kingside : castling_rights.white_queenside;
    } else {
        hasRight = isKingside ? castling_rights.black_kingside : castling_rights.black_queenside;
    }
    if (!hasRight) {
        return false;
    }

    int rookSquare = getCastlingRookSquares(from, to).first;
    Piece rook = board_.getPiece(rookSquare);
    if (rook.type != PieceType::ROOK || rook.color != current_player) {
        return false;
    }

    // Every square between king and rook must be empty
    int rank = getRank(from);
    int step = isKingside ? 1 : -1;
    for (int f = getFile(from) + step; f != getFile(rookSquare); f += step) {
        if (!board_.isEmpty(getSquare(rank, f))) {
            return false;
        }
    }

    // King may not start on, pass through, or land on an attacked square
    PieceColor opponent = oppositeColor(current_player);
    for (int f = getFile(from); f != getFile(to) + step; f += step) {
        if (isSquareAttacked(getSquare(rank, f), opponent)) {
            return false;
        }
    }

    return true;
}

bool ChessRules::isValidEnPassant(int from, int to, PieceColor current_player, int en_passant_square) const {
    if (!isEnPassantPattern(from, to, en_passant_square)) {
        return false;
    }

    // The bypassed pawn stands beside the mover, on the destination file
    Piece bypassed = board_.getPiece(getSquare(getRank(from), getFile(to)));
    return bypassed.type == PieceType::PAWN && bypassed.color == oppositeColor(current_player);
}

bool ChessRules::moveExposesKing(int from, int to, PieceColor current_player, int en_passant_square) const {
    ChessBoard next = applyMove(board_, from, to, en_passant_square);
    return ChessRules(next).isInCheck(current_player);
}

std::vector<int> ChessRules::candidateDestinations(int from, int en_passant_square) const {
    std::vector<int> candidates = pseudoLegalDestinations(board_, from);
    Piece piece = board_.getPiece(from);

    if (piece.type == PieceType::KING) {
        for (int fileOffset : {-2, 2}) {
            int file = getFile(from) + fileOffset;
            if (isOnBoard(getRank(from), file)) {
                candidates.push_back(getSquare(getRank(from), file));
            }
        }
    } else if (piece.type == PieceType::PAWN && isEnPassantPattern(from, en_passant_square, en_passant_square)) {
        candidates.push_back(en_passant_square);
    }

    // Ascending order keeps enumeration identical to a full square scan
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    return candidates;
}

} // namespace chess
} // namespace gambit

// src/games/chess/chess_board.cpp
#include "gambit/games/chess/chess_board.h"
#include <sstream>
#include <cctype>

namespace gambit {
namespace chess {

namespace {

const PieceType BACK_RANK[BOARD_SIZE] = {
    PieceType::ROOK, PieceType::KNIGHT, PieceType::BISHOP, PieceType::QUEEN,
    PieceType::KING, PieceType::BISHOP, PieceType::KNIGHT, PieceType::ROOK
};

} // namespace

ChessBoard ChessBoard::standard() {
    ChessBoard board;
    for (int col = 0; col < BOARD_SIZE; ++col) {
        board.setPiece(getSquare(0, col), {BACK_RANK[col], PieceColor::BLACK});
        board.setPiece(getSquare(1, col), {PieceType::PAWN, PieceColor::BLACK});
        board.setPiece(getSquare(6, col), {PieceType::PAWN, PieceColor::WHITE});
        board.setPiece(getSquare(7, col), {BACK_RANK[col], PieceColor::WHITE});
    }
    return board;
}

Piece ChessBoard::getPiece(int square) const {
    if (!isValidSquare(square)) {
        return Piece();
    }
    return cells_[square];
}

void ChessBoard::setPiece(int square, Piece piece) {
    if (!isValidSquare(square)) {
        return;
    }
    piece.square = piece.is_empty() ? NO_SQUARE : square;
    cells_[square] = piece;
}

void ChessBoard::clearSquare(int square) {
    setPiece(square, Piece());
}

Piece ChessBoard::movePiece(int from, int to) {
    Piece moving = getPiece(from);
    Piece captured = getPiece(to);
    clearSquare(from);
    setPiece(to, moving);
    return captured;
}

int ChessBoard::findKing(PieceColor color) const {
    for (int square = 0; square < NUM_SQUARES; ++square) {
        const Piece& piece = cells_[square];
        if (piece.type == PieceType::KING && piece.color == color) {
            return square;
        }
    }
    return NO_SQUARE;
}

int ChessBoard::countPieces(PieceType type, PieceColor color) const {
    int count = 0;
    for (const Piece& piece : cells_) {
        if (piece.type == type && piece.color == color) {
            count++;
        }
    }
    return count;
}

bool ChessBoard::setFromPlacement(const std::string& placement) {
    clear();

    int row = 0, col = 0;
    for (char c : placement) {
        if (c == '/') {
            if (col != BOARD_SIZE) {
                clear();
                return false;
            }
            row++;
            col = 0;
            if (row >= BOARD_SIZE) {
                clear();
                return false;
            }
        } else if (c >= '1' && c <= '8') {
            col += c - '0';
            if (col > BOARD_SIZE) {
                clear();
                return false;
            }
        } else {
            Piece piece = pieceFromSymbol(c);
            if (piece.is_empty() || col >= BOARD_SIZE) {
                clear();
                return false;
            }
            setPiece(getSquare(row, col), piece);
            col++;
        }
    }

    if (row != BOARD_SIZE - 1 || col != BOARD_SIZE) {
        clear();
        return false;
    }

    // Two kings of one color cannot be a game position
    if (countPieces(PieceType::KING, PieceColor::WHITE) > 1 ||
        countPieces(PieceType::KING, PieceColor::BLACK) > 1) {
        clear();
        return false;
    }

    return true;
}

std::string ChessBoard::toPlacement() const {
    std::stringstream ss;

    for (int row = 0; row < BOARD_SIZE; ++row) {
        int emptyCount = 0;
        for (int col = 0; col < BOARD_SIZE; ++col) {
            const Piece& piece = cells_[getSquare(row, col)];
            if (piece.is_empty()) {
                emptyCount++;
                continue;
            }
            if (emptyCount > 0) {
                ss << emptyCount;
                emptyCount = 0;
            }
            ss << pieceSymbol(piece);
        }

        if (emptyCount > 0) {
            ss << emptyCount;
        }
        if (row < BOARD_SIZE - 1) {
            ss << '/';
        }
    }

    return ss.str();
}

void ChessBoard::clear() {
    cells_.fill(Piece());
}

} // namespace chess
} // namespace gambit

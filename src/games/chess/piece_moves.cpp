// src/games/chess/piece_moves.cpp
#include "gambit/games/chess/piece_moves.h"

namespace gambit {
namespace chess {

const std::vector<std::pair<int, int>> KNIGHT_MOVES = {
    {-2, -1}, {-2, 1}, {2, -1}, {2, 1}, {-1, -2}, {-1, 2}, {1, -2}, {1, 2}
};

const std::vector<std::pair<int, int>> KING_MOVES = {
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
};

// Sliding piece directions (bishop, rook, queen)
const std::vector<std::pair<int, int>> BISHOP_DIRECTIONS = {
    {-1, -1}, {-1, 1}, {1, -1}, {1, 1}
};

const std::vector<std::pair<int, int>> ROOK_DIRECTIONS = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
};

const std::vector<std::pair<int, int>> QUEEN_DIRECTIONS = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}, {-1, -1}, {-1, 1}, {1, -1}, {1, 1}
};

std::vector<int> pseudoLegalDestinations(const ChessBoard& board, int square) {
    std::vector<int> moves;
    Piece piece = board.getPiece(square);

    switch (piece.type) {
        case PieceType::PAWN:
            addPawnMoves(board, piece, moves);
            break;
        case PieceType::KNIGHT:
            addKnightMoves(board, piece, moves);
            break;
        case PieceType::BISHOP:
            addSlidingMoves(board, piece, BISHOP_DIRECTIONS, moves);
            break;
        case PieceType::ROOK:
            addSlidingMoves(board, piece, ROOK_DIRECTIONS, moves);
            break;
        case PieceType::QUEEN:
            addSlidingMoves(board, piece, QUEEN_DIRECTIONS, moves);
            break;
        case PieceType::KING:
            addKingMoves(board, piece, moves);
            break;
        case PieceType::NONE:
            break;
    }

    return moves;
}

void addPawnMoves(const ChessBoard& board, const Piece& piece, std::vector<int>& moves) {
    int rank = getRank(piece.square);
    int file = getFile(piece.square);
    int direction = pawnDirection(piece.color);

    // Regular move forward
    int newRank = rank + direction;
    if (newRank >= 0 && newRank < BOARD_SIZE) {
        int newSquare = getSquare(newRank, file);
        if (board.isEmpty(newSquare)) {
            moves.push_back(newSquare);

            // Initial two-square move
            if (rank == pawnHomeRow(piece.color)) {
                int twoSquareNewSquare = getSquare(newRank + direction, file);
                if (board.isEmpty(twoSquareNewSquare)) {
                    moves.push_back(twoSquareNewSquare);
                }
            }
        }
    }

    // Diagonal captures onto enemy pieces only
    for (int fileOffset : {-1, 1}) {
        int newFile = file + fileOffset;
        if (!isOnBoard(newRank, newFile)) {
            continue;
        }

        Piece target = board.getPiece(getSquare(newRank, newFile));
        if (!target.is_empty() && target.color != piece.color) {
            moves.push_back(getSquare(newRank, newFile));
        }
    }
}

void addKnightMoves(const ChessBoard& board, const Piece& piece, std::vector<int>& moves) {
    int rank = getRank(piece.square);
    int file = getFile(piece.square);

    for (const auto& [rankOffset, fileOffset] : KNIGHT_MOVES) {
        int newRank = rank + rankOffset;
        int newFile = file + fileOffset;

        if (isOnBoard(newRank, newFile)) {
            int newSquare = getSquare(newRank, newFile);
            Piece target = board.getPiece(newSquare);

            if (target.is_empty() || target.color != piece.color) {
                moves.push_back(newSquare);
            }
        }
    }
}

void addKingMoves(const ChessBoard& board, const Piece& piece, std::vector<int>& moves) {
    int rank = getRank(piece.square);
    int file = getFile(piece.square);

    for (const auto& [rankOffset, fileOffset] : KING_MOVES) {
        int newRank = rank + rankOffset;
        int newFile = file + fileOffset;

        if (isOnBoard(newRank, newFile)) {
            int newSquare = getSquare(newRank, newFile);
            Piece target = board.getPiece(newSquare);

            if (target.is_empty() || target.color != piece.color) {
                moves.push_back(newSquare);
            }
        }
    }
}

void addSlidingMoves(const ChessBoard& board, const Piece& piece,
                     const std::vector<std::pair<int, int>>& directions,
                     std::vector<int>& moves) {
    int rank = getRank(piece.square);
    int file = getFile(piece.square);

    for (const auto& [rankDir, fileDir] : directions) {
        for (int step = 1; ; ++step) {
            int newRank = rank + rankDir * step;
            int newFile = file + fileDir * step;

            if (!isOnBoard(newRank, newFile)) {
                break;  // Off the board
            }

            int newSquare = getSquare(newRank, newFile);
            Piece target = board.getPiece(newSquare);

            if (target.is_empty()) {
                moves.push_back(newSquare);
            } else if (target.color != piece.color) {
                moves.push_back(newSquare);
                break;  // Can't move beyond a capture
            } else {
                break;  // Own piece blocks the ray
            }
        }
    }
}

} // namespace chess
} // namespace gambit

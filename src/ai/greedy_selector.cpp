// src/ai/greedy_selector.cpp
#include "gambit/ai/greedy_selector.h"
#include "gambit/ai/random_selector.h"
#include "gambit/games/chess/square.h"
#include <spdlog/spdlog.h>
#include <limits>

namespace gambit {
namespace ai {

GreedySelector::GreedySelector(chess::PieceColor color, unsigned int seed)
    : MoveSelector(color), rng_(resolveSeed(seed)) {
}

std::optional<chess::ChessMove> GreedySelector::selectMove(const chess::ChessState& state) {
    std::vector<chess::ChessMove> moves = state.getAllLegalMoves(color_);
    if (moves.empty()) {
        return std::nullopt;
    }

    std::optional<chess::ChessMove> bestMove;
    int bestScore = std::numeric_limits<int>::min();

    for (const chess::ChessMove& move : moves) {
        chess::ChessState next(state);
        if (!next.makeMove(move).success) {
            continue;
        }

        int score = evaluate(next, color_);
        if (!bestMove || score > bestScore) {
            bestScore = score;
            bestMove = move;
        }
    }

    if (!bestMove) {
        spdlog::warn("GreedySelector: No move could be evaluated for {}, picking at random",
                     chess::colorName(color_));
        return RandomSelector::pick(moves, rng_);
    }

    spdlog::debug("GreedySelector: {} plays {}{} (score {})", chess::colorName(color_),
                  chess::squareName(bestMove->from_square), chess::squareName(bestMove->to_square), bestScore);
    return bestMove;
}

int GreedySelector::evaluate(const chess::ChessState& state, chess::PieceColor color) {
    chess::PieceColor opponent = chess::oppositeColor(color);

    int materialScore = material(state.getBoard(), color) - material(state.getBoard(), opponent);
    int mobilityScore = mobility(state, color) - mobility(state, opponent);

    return materialScore + mobilityScore;
}

int GreedySelector::material(const chess::ChessBoard& board, chess::PieceColor color) {
    int total = 0;
    for (int square = 0; square < chess::NUM_SQUARES; ++square) {
        chess::Piece piece = board.getPiece(square);
        if (piece.color == color) {
            total += pieceValue(piece.type);
        }
    }
    return total;
}

int GreedySelector::mobility(const chess::ChessState& state, chess::PieceColor color) {
    return static_cast<int>(state.getAllLegalMoves(color).size());
}

int GreedySelector::pieceValue(chess::PieceType type) {
    switch (type) {
        case chess::PieceType::PAWN:   return 1;
        case chess::PieceType::KNIGHT: return 3;
        case chess::PieceType::BISHOP: return 3;
        case chess::PieceType::ROOK:   return 5;
        case chess::PieceType::QUEEN:  return 9;
        case chess::PieceType::KING:   return 0;
        case chess::PieceType::NONE:   return 0;
    }
    return 0;
}

} // namespace ai
} // namespace gambit

// src/ai/random_selector.cpp
#include "gambit/ai/random_selector.h"

namespace gambit {
namespace ai {

RandomSelector::RandomSelector(chess::PieceColor color, unsigned int seed)
    : MoveSelector(color), rng_(resolveSeed(seed)) {
}

std::optional<chess::ChessMove> RandomSelector::selectMove(const chess::ChessState& state) {
    return pick(state.getAllLegalMoves(color_), rng_);
}

std::optional<chess::ChessMove> RandomSelector::pick(
    const std::vector<chess::ChessMove>& moves, std::mt19937& rng) {

    if (moves.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    return moves[dist(rng)];
}

} // namespace ai
} // namespace gambit

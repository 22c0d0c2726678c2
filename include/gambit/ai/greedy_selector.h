// include/gambit/ai/greedy_selector.h
#ifndef GAMBIT_GREEDY_SELECTOR_H
#define GAMBIT_GREEDY_SELECTOR_H

#include "gambit/ai/move_selector.h"
#include <random>

namespace gambit {
namespace ai {

/**
 * @brief Single-ply selector maximizing material plus mobility
 *
 * Every legal move is played on a copy of the state and the resulting
 * position is scored from the selector's point of view:
 *
 *   (material(mine) - material(theirs)) + (mobility(mine) - mobility(theirs))
 *
 * Ties keep the first move in enumeration order, so the choice is fully
 * determined by the position.
 */
class GreedySelector : public MoveSelector {
public:
    /**
     * @brief Constructor
     *
     * @param color Color to play
     * @param seed Seed of the fallback random pick (0 for random)
     */
    explicit GreedySelector(chess::PieceColor color, unsigned int seed = 0);

    std::optional<chess::ChessMove> selectMove(const chess::ChessState& state) override;

    std::string getName() const override { return "greedy"; }

    /**
     * @brief Score of a position for a color
     */
    static int evaluate(const chess::ChessState& state, chess::PieceColor color);

    /**
     * @brief Sum of piece values of a color (P1 N3 B3 R5 Q9 K0)
     */
    static int material(const chess::ChessBoard& board, chess::PieceColor color);

    /**
     * @brief Number of legal moves of a color
     *
     * Zero for the side not on move, so after a candidate move only the
     * opponent's replies count against it.
     */
    static int mobility(const chess::ChessState& state, chess::PieceColor color);

    static int pieceValue(chess::PieceType type);

private:
    std::mt19937 rng_;
};

} // namespace ai
} // namespace gambit

#endif // GAMBIT_GREEDY_SELECTOR_H

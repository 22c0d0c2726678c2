// include/gambit/ai/random_selector.h
#ifndef GAMBIT_RANDOM_SELECTOR_H
#define GAMBIT_RANDOM_SELECTOR_H

#include "gambit/ai/move_selector.h"
#include <random>
#include <vector>

namespace gambit {
namespace ai {

/**
 * @brief Selector that samples uniformly from the legal moves
 */
class RandomSelector : public MoveSelector {
public:
    /**
     * @brief Constructor
     *
     * @param color Color to play
     * @param seed Random seed (0 for random)
     */
    explicit RandomSelector(chess::PieceColor color, unsigned int seed = 0);

    std::optional<chess::ChessMove> selectMove(const chess::ChessState& state) override;

    std::string getName() const override { return "random"; }

    /**
     * @brief Uniform pick from a move list
     *
     * @return Nothing if the list is empty
     */
    static std::optional<chess::ChessMove> pick(const std::vector<chess::ChessMove>& moves, std::mt19937& rng);

private:
    std::mt19937 rng_;
};

} // namespace ai
} // namespace gambit

#endif // GAMBIT_RANDOM_SELECTOR_H

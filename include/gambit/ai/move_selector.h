// include/gambit/ai/move_selector.h
#ifndef GAMBIT_MOVE_SELECTOR_H
#define GAMBIT_MOVE_SELECTOR_H

#include "gambit/games/chess/chess_state.h"
#include <memory>
#include <optional>
#include <string>

namespace gambit {
namespace ai {

/**
 * @brief Automated opponent bound to one color
 *
 * Implementations read the state and never modify it. An empty result means
 * the bound color has no legal move in the given state.
 */
class MoveSelector {
public:
    explicit MoveSelector(chess::PieceColor color) : color_(color) {}
    virtual ~MoveSelector() = default;

    /**
     * @brief Choose a move for the bound color
     *
     * @param state Current game state
     * @return Chosen move, or nothing if there is no legal move
     */
    virtual std::optional<chess::ChessMove> selectMove(const chess::ChessState& state) = 0;

    /**
     * @brief Strategy name as accepted by createMoveSelector()
     */
    virtual std::string getName() const = 0;

    chess::PieceColor getColor() const { return color_; }

protected:
    chess::PieceColor color_;
};

/**
 * @brief Create a selector by strategy name
 *
 * @param name "random" or "greedy"
 * @param color Color the selector plays
 * @param seed Random seed (0 for a time-based seed)
 * @return Owned selector
 * @throws core::UnknownStrategyException for any other name
 */
std::unique_ptr<MoveSelector> createMoveSelector(
    const std::string& name, chess::PieceColor color, unsigned int seed = 0);

/**
 * @brief Seed to use for a requested seed, 0 meaning time-based
 */
unsigned int resolveSeed(unsigned int seed);

} // namespace ai
} // namespace gambit

#endif // GAMBIT_MOVE_SELECTOR_H

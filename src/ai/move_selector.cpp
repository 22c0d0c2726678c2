// src/ai/move_selector.cpp
#include "gambit/ai/move_selector.h"
#include "gambit/ai/random_selector.h"
#include "gambit/ai/greedy_selector.h"
#include "gambit/core/exceptions.h"
#include <chrono>

namespace gambit {
namespace ai {

std::unique_ptr<MoveSelector> createMoveSelector(
    const std::string& name, chess::PieceColor color, unsigned int seed) {

    if (name == "random") {
        return std::make_unique<RandomSelector>(color, seed);
    }
    if (name == "greedy") {
        return std::make_unique<GreedySelector>(color, seed);
    }
    throw core::UnknownStrategyException(name);
}

unsigned int resolveSeed(unsigned int seed) {
    if (seed != 0) {
        return seed;
    }
    // Use current time as seed if none provided
    return static_cast<unsigned int>(
        std::chrono::system_clock::now().time_since_epoch().count());
}

} // namespace ai
} // namespace gambit

// src/api/engine_api.cpp
#include "gambit/api/engine_api.h"
#include "gambit/games/chess/square.h"
#include <spdlog/spdlog.h>

namespace gambit {
namespace api {

std::unique_ptr<chess::ChessState> newGame(const std::string& fen) {
    auto state = std::make_unique<chess::ChessState>();
    if (fen.empty()) {
        return state;
    }

    if (!state->setFromFEN(fen)) {
        spdlog::error("EngineApi: Invalid starting position '{}'", fen);
        return nullptr;
    }
    return state;
}

std::vector<std::string> legalDestinations(const chess::ChessState& state, const std::string& square) {
    std::vector<std::string> names;

    chess::SquareResult origin = chess::squareFromName(square);
    if (!origin) {
        return names;
    }

    for (int destination : state.getLegalDestinations(origin.value())) {
        names.push_back(chess::squareName(destination));
    }
    return names;
}

chess::MoveOutcome attemptMove(chess::ChessState& state, const std::string& from,
                               const std::string& to, char promotion) {
    return state.makeMove(from, to, promotion);
}

chess::GameStatus status(const chess::ChessState& state) {
    return state.getStatus();
}

std::optional<chess::ChessMove> selectMove(ai::MoveSelector& selector, const chess::ChessState& state) {
    if (state.isTerminal()) {
        return std::nullopt;
    }
    return selector.selectMove(state);
}

} // namespace api
} // namespace gambit

// include/gambit/api/engine_api.h
#ifndef GAMBIT_ENGINE_API_H
#define GAMBIT_ENGINE_API_H

#include "gambit/games/chess/chess_state.h"
#include "gambit/ai/move_selector.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gambit {
namespace api {

/**
 * @brief Start a game
 *
 * @param fen Starting position, empty for the standard position. The
 *            placement field is required, the remaining FEN fields are
 *            optional.
 * @return New state, or nullptr if the position is malformed
 */
std::unique_ptr<chess::ChessState> newGame(const std::string& fen = "");

/**
 * @brief Legal destinations of the piece on a square
 *
 * @param state Game state
 * @param square Algebraic square name, e.g. "e2"
 * @return Destination names in board order, empty for an invalid or empty square
 */
std::vector<std::string> legalDestinations(const chess::ChessState& state, const std::string& square);

/**
 * @brief Submit a move
 *
 * @param state Game state, unchanged when the move is rejected
 * @param from Origin square name
 * @param to Destination square name
 * @param promotion Promotion letter, queen if absent or invalid
 * @return Success flag and human-readable message
 */
chess::MoveOutcome attemptMove(chess::ChessState& state, const std::string& from,
                               const std::string& to, char promotion = '\0');

chess::GameStatus status(const chess::ChessState& state);

/**
 * @brief Ask an opponent for its move
 *
 * @return Chosen move, or nothing when the opponent has no legal move
 */
std::optional<chess::ChessMove> selectMove(ai::MoveSelector& selector, const chess::ChessState& state);

} // namespace api
} // namespace gambit

#endif // GAMBIT_ENGINE_API_H

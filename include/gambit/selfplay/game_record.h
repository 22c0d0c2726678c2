// include/gambit/selfplay/game_record.h
#ifndef GAMBIT_GAME_RECORD_H
#define GAMBIT_GAME_RECORD_H

#include "gambit/games/chess/chess_state.h"
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace gambit {
namespace selfplay {

/**
 * @brief Move data in a game record
 */
struct MoveData {
    std::string from;                   // Origin square name
    std::string to;                     // Destination square name
    char piece = '.';                   // Symbol of the piece that moved
    char promotion = '\0';              // Promotion letter, '\0' if none

    bool operator==(const MoveData& other) const {
        return from == other.from && to == other.to &&
               piece == other.piece && promotion == other.promotion;
    }
};

/**
 * @brief Record of a played game
 *
 * Holds the starting position, the moves in order, both captured-piece
 * ledgers and the final status. A record can be turned back into a game
 * state by replaying its moves.
 */
class GameRecord {
public:
    /**
     * @brief Constructor
     *
     * @param startingFen Starting position, empty for the standard position
     * @param whitePlayer Name of the white player kind
     * @param blackPlayer Name of the black player kind
     */
    explicit GameRecord(const std::string& startingFen = "",
                        const std::string& whitePlayer = "human",
                        const std::string& blackPlayer = "human");

    /**
     * @brief Build a record from a game state's history
     *
     * @param state State whose moves are recorded
     * @param startingFen Position the state was created from
     */
    static GameRecord fromState(const chess::ChessState& state,
                                const std::string& startingFen,
                                const std::string& whitePlayer = "human",
                                const std::string& blackPlayer = "human");

    /**
     * @brief Add a move to the record
     */
    void addMove(const chess::MoveRecord& move);

    void setResult(chess::GameStatus result) { result_ = result; }
    void setCaptured(const std::string& byWhite, const std::string& byBlack);

    const std::string& getStartingFen() const { return startingFen_; }
    const std::string& getWhitePlayer() const { return whitePlayer_; }
    const std::string& getBlackPlayer() const { return blackPlayer_; }
    const std::vector<MoveData>& getMoves() const { return moves_; }
    chess::GameStatus getResult() const { return result_; }
    const std::string& getCapturedByWhite() const { return capturedByWhite_; }
    const std::string& getCapturedByBlack() const { return capturedByBlack_; }

    /**
     * @brief Recreate the game by replaying every move on a new state
     *
     * @return Final state
     * @throws std::runtime_error if a recorded move is rejected
     */
    std::unique_ptr<chess::ChessState> replay() const;

    /**
     * @brief Serialize to JSON
     *
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * @param json JSON string
     * @return GameRecord object
     * @throws std::runtime_error on malformed input
     */
    static GameRecord fromJson(const std::string& json);

    /**
     * @brief Save to file
     *
     * @param filename Filename to save to
     * @return true if successful, false otherwise
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * @brief Load from file
     *
     * @param filename Filename to load from
     * @return GameRecord object
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static GameRecord loadFromFile(const std::string& filename);

    static std::string resultToString(chess::GameStatus result);
    static chess::GameStatus resultFromString(const std::string& text);

private:
    std::string startingFen_;
    std::string whitePlayer_;
    std::string blackPlayer_;
    std::vector<MoveData> moves_;
    std::string capturedByWhite_;       // Black pieces taken by White
    std::string capturedByBlack_;       // White pieces taken by Black
    chess::GameStatus result_;
    std::chrono::system_clock::time_point timestamp_;  // When the game was played
};

} // namespace selfplay
} // namespace gambit

#endif // GAMBIT_GAME_RECORD_H

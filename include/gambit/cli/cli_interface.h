// include/gambit/cli/cli_interface.h
#ifndef GAMBIT_CLI_INTERFACE_H
#define GAMBIT_CLI_INTERFACE_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <map>
#include <optional>
#include "gambit/core/engine_config.h"
#include "gambit/games/chess/chess_state.h"
#include "gambit/ai/move_selector.h"

namespace gambit {
namespace cli {

/**
 * @brief Terminal driver for a chess game
 *
 * Each side is either a human typing moves at the prompt or an engine
 * strategy. Engine sides move on their own whenever it is their turn.
 */
class CLIInterface {
public:
    /**
     * @brief Constructor
     *
     * @param config Session settings
     * @throws core::GameStateException for an invalid player kind or starting position
     */
    explicit CLIInterface(const core::EngineConfig& config);

    /**
     * @brief Run the interactive loop until quit, end of input, or game end
     *
     * @return Exit code
     */
    int run();

    /**
     * @brief Handle one line typed at the prompt
     *
     * @return false once the session should stop
     */
    bool handleLine(const std::string& line);

    /**
     * @brief Execute a single command
     *
     * @param command Command to execute
     * @param args Arguments for the command
     * @return true if the command exists, false otherwise
     */
    bool executeCommand(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Let engine sides move until a human is on move or the game stops
     *
     * @return Number of moves played
     */
    int playEngineMoves();

    /**
     * @brief Set output callback for flexibility in displaying output
     */
    void setOutputCallback(std::function<void(const std::string&)> callback);

    /**
     * @brief Set callback writing the input prompt (no line break)
     */
    void setPromptCallback(std::function<void(const std::string&)> callback);

    /**
     * @brief Set input callback; an empty result means end of input
     */
    void setInputCallback(std::function<std::optional<std::string>()> callback);

    const chess::ChessState& getCurrentState() const { return *currentState_; }
    bool isRunning() const { return running_; }
    bool plyLimitReached() const;

private:
    core::EngineConfig config_;
    std::string startingFen_;
    std::unique_ptr<chess::ChessState> currentState_;
    std::unique_ptr<ai::MoveSelector> whiteEngine_;     // nullptr for a human side
    std::unique_ptr<ai::MoveSelector> blackEngine_;
    bool running_ = true;
    bool announcedEnd_ = false;

    // Callbacks for I/O
    std::function<void(const std::string&)> outputCallback_;
    std::function<void(const std::string&)> promptCallback_;
    std::function<std::optional<std::string>()> inputCallback_;

    // Command handlers
    using CommandHandler = std::function<bool(const std::vector<std::string>&)>;
    std::map<std::string, CommandHandler> commands_;
    std::map<std::string, std::string> commandHelp_;

    void registerCommands();
    void startGame(const std::string& fen);
    ai::MoveSelector* engineFor(chess::PieceColor color) const;
    bool submitMove(const std::string& from, const std::string& to, char promotion);
    void announceIfOver();
    void saveRecordIfConfigured();

    // Output a message
    void output(const std::string& message);

    // Command implementations
    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdNew(const std::vector<std::string>& args);
    bool cmdMove(const std::vector<std::string>& args);
    bool cmdMoves(const std::vector<std::string>& args);
    bool cmdBoard(const std::vector<std::string>& args);
    bool cmdFen(const std::vector<std::string>& args);
    bool cmdHistory(const std::vector<std::string>& args);
    bool cmdCaptured(const std::vector<std::string>& args);
    bool cmdSave(const std::vector<std::string>& args);
    bool cmdLoad(const std::vector<std::string>& args);
    bool cmdQuit(const std::vector<std::string>& args);
};

} // namespace cli
} // namespace gambit

#endif // GAMBIT_CLI_INTERFACE_H

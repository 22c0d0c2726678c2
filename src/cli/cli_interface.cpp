// src/cli/cli_interface.cpp
#include "gambit/cli/cli_interface.h"
#include "gambit/cli/command_parser.h"
#include "gambit/api/engine_api.h"
#include "gambit/core/exceptions.h"
#include "gambit/games/chess/square.h"
#include "gambit/selfplay/game_record.h"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace gambit {
namespace cli {

CLIInterface::CLIInterface(const core::EngineConfig& config)
    : config_(config) {

    std::string problem = config_.validate();
    if (!problem.empty()) {
        throw core::GameStateException(problem);
    }

    // Set default callbacks
    outputCallback_ = [](const std::string& message) {
        std::cout << message << std::endl;
    };

    promptCallback_ = [](const std::string& prompt) {
        std::cout << prompt << std::flush;
    };

    inputCallback_ = []() -> std::optional<std::string> {
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    };

    // Engines get distinct seeds so a fixed seed still gives two different players
    unsigned int seed = ai::resolveSeed(config_.seed);
    if (config_.white != "human") {
        whiteEngine_ = ai::createMoveSelector(config_.white, chess::PieceColor::WHITE, seed);
    }
    if (config_.black != "human") {
        blackEngine_ = ai::createMoveSelector(config_.black, chess::PieceColor::BLACK, seed + 1);
    }

    startGame(config_.starting_fen);
    registerCommands();
}

int CLIInterface::run() {
    output("Gambit chess");
    output("============");
    output("White: " + config_.white + ", Black: " + config_.black);
    output("Type 'help' for a list of commands.");
    output(currentState_->toString());

    while (running_) {
        playEngineMoves();
        if (!running_) {
            break;
        }

        // Engine-only games need no input
        if (whiteEngine_ && blackEngine_) {
            announceIfOver();
            break;
        }

        promptCallback_("> ");
        std::optional<std::string> line = inputCallback_();
        if (!line) {
            break;
        }
        handleLine(*line);
    }

    saveRecordIfConfigured();
    return 0;
}

bool CLIInterface::handleLine(const std::string& line) {
    std::vector<std::string> tokens = CommandParser::tokenize(line);
    if (tokens.empty()) {
        return running_;
    }

    std::string command = CommandParser::toLower(tokens[0]);
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (executeCommand(command, args)) {
        return running_;
    }

    // Anything else is read as a move
    std::optional<MoveInput> move = CommandParser::parseMove(tokens);
    if (!move) {
        output("Unknown command: " + tokens[0]);
        output("Type 'help' for a list of commands.");
        return running_;
    }

    if (submitMove(move->from, move->to, move->promotion)) {
        playEngineMoves();
    }
    return running_;
}

bool CLIInterface::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(CommandParser::toLower(command));
    if (it == commands_.end()) {
        return false;
    }

    it->second(args);
    return true;
}

int CLIInterface::playEngineMoves() {
    int played = 0;

    while (running_ && !currentState_->isTerminal() && !plyLimitReached()) {
        ai::MoveSelector* engine = engineFor(currentState_->getCurrentPlayer());
        if (!engine) {
            break;
        }

        std::optional<chess::ChessMove> move = api::selectMove(*engine, *currentState_);
        if (!move) {
            break;
        }

        chess::MoveOutcome outcome = currentState_->makeMove(*move);
        if (!outcome.success) {
            spdlog::error("CLI: {} engine produced a rejected move {}{}: {}", engine->getName(),
                          chess::squareName(move->from_square), chess::squareName(move->to_square),
                          outcome.message);
            running_ = false;
            break;
        }

        played++;
        output(chess::colorName(engine->getColor()) + " (" + engine->getName() + ") plays " +
               chess::squareName(move->from_square) + chess::squareName(move->to_square));
    }

    if (played > 0) {
        output(currentState_->toString());
    }
    announceIfOver();
    return played;
}

bool CLIInterface::plyLimitReached() const {
    return config_.max_plies > 0 &&
           static_cast<int>(currentState_->getMoveHistory().size()) >= config_.max_plies;
}

void CLIInterface::setOutputCallback(std::function<void(const std::string&)> callback) {
    if (callback) {
        outputCallback_ = callback;
    }
}

void CLIInterface::setPromptCallback(std::function<void(const std::string&)> callback) {
    if (callback) {
        promptCallback_ = callback;
    }
}

void CLIInterface::setInputCallback(std::function<std::optional<std::string>()> callback) {
    if (callback) {
        inputCallback_ = callback;
    }
}

void CLIInterface::registerCommands() {
    commands_["help"] = [this](const std::vector<std::string>& args) { return cmdHelp(args); };
    commandHelp_["help"] = "Display help information. Usage: help [command]";

    commands_["new"] = [this](const std::vector<std::string>& args) { return cmdNew(args); };
    commandHelp_["new"] = "Start a new game. Usage: new [\"fen\"]";

    commands_["move"] = [this](const std::vector<std::string>& args) { return cmdMove(args); };
    commandHelp_["move"] = "Make a move. Usage: move <from> <to> [q|r|b|n], or just type e2 e4 / e7e8q";

    commands_["moves"] = [this](const std::vector<std::string>& args) { return cmdMoves(args); };
    commandHelp_["moves"] = "List legal destinations of a piece. Usage: moves <square>";

    commands_["board"] = [this](const std::vector<std::string>& args) { return cmdBoard(args); };
    commandHelp_["board"] = "Show the current board. Usage: board";

    commands_["fen"] = [this](const std::vector<std::string>& args) { return cmdFen(args); };
    commandHelp_["fen"] = "Print the position as FEN. Usage: fen";

    commands_["history"] = [this](const std::vector<std::string>& args) { return cmdHistory(args); };
    commandHelp_["history"] = "List the moves played. Usage: history";

    commands_["captured"] = [this](const std::vector<std::string>& args) { return cmdCaptured(args); };
    commandHelp_["captured"] = "Show captured pieces. Usage: captured";

    commands_["save"] = [this](const std::vector<std::string>& args) { return cmdSave(args); };
    commandHelp_["save"] = "Save the game record. Usage: save <filename>";

    commands_["load"] = [this](const std::vector<std::string>& args) { return cmdLoad(args); };
    commandHelp_["load"] = "Load a saved game record. Usage: load <filename>";

    commands_["quit"] = [this](const std::vector<std::string>& args) { return cmdQuit(args); };
    commandHelp_["quit"] = "Quit the program. Usage: quit";
    commands_["exit"] = commands_["quit"];
    commandHelp_["exit"] = commandHelp_["quit"];
}

void CLIInterface::startGame(const std::string& fen) {
    std::unique_ptr<chess::ChessState> state = api::newGame(fen);
    if (!state) {
        throw core::GameStateException("Invalid starting position: " + fen);
    }

    currentState_ = std::move(state);
    startingFen_ = currentState_->toFEN();
    announcedEnd_ = false;
}

ai::MoveSelector* CLIInterface::engineFor(chess::PieceColor color) const {
    return color == chess::PieceColor::WHITE ? whiteEngine_.get() : blackEngine_.get();
}

bool CLIInterface::submitMove(const std::string& from, const std::string& to, char promotion) {
    if (engineFor(currentState_->getCurrentPlayer())) {
        output("It is the engine's turn.");
        return false;
    }
    if (plyLimitReached()) {
        output("Ply limit reached.");
        return false;
    }

    chess::MoveOutcome outcome = api::attemptMove(*currentState_, from, to, promotion);
    output(outcome.message);
    if (!outcome.success) {
        return false;
    }

    output(currentState_->toString());
    announceIfOver();
    return true;
}

void CLIInterface::announceIfOver() {
    if (announcedEnd_) {
        return;
    }

    if (currentState_->isTerminal()) {
        output("Game over: " + chess::statusToString(currentState_->getStatus()));
        announcedEnd_ = true;
    } else if (plyLimitReached()) {
        output("Ply limit of " + std::to_string(config_.max_plies) + " reached.");
        announcedEnd_ = true;
    }
}

void CLIInterface::saveRecordIfConfigured() {
    if (config_.record_path.empty()) {
        return;
    }

    selfplay::GameRecord record = selfplay::GameRecord::fromState(
        *currentState_, startingFen_, config_.white, config_.black);
    if (!record.saveToFile(config_.record_path)) {
        output("Error saving game to file: " + config_.record_path);
    }
}

void CLIInterface::output(const std::string& message) {
    outputCallback_(message);
}

bool CLIInterface::cmdHelp(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Available commands:");
        for (const auto& [name, help] : commandHelp_) {
            output("  " + name + " - " + help);
        }
        return true;
    }

    auto it = commandHelp_.find(CommandParser::toLower(args[0]));
    if (it == commandHelp_.end()) {
        output("Unknown command: " + args[0]);
        return false;
    }
    output(it->second);
    return true;
}

bool CLIInterface::cmdNew(const std::vector<std::string>& args) {
    std::string fen;
    for (const auto& arg : args) {
        fen += (fen.empty() ? "" : " ") + arg;
    }

    try {
        startGame(fen);
    } catch (const core::GameStateException& e) {
        output(std::string("Error creating game: ") + e.what());
        return false;
    }

    output("New game started.");
    output(currentState_->toString());
    return true;
}

bool CLIInterface::cmdMove(const std::vector<std::string>& args) {
    std::optional<MoveInput> move = CommandParser::parseMove(args);
    if (!move) {
        output("Invalid move. Usage: move <from> <to> [q|r|b|n]");
        return false;
    }

    if (!submitMove(move->from, move->to, move->promotion)) {
        return false;
    }
    playEngineMoves();
    return true;
}

bool CLIInterface::cmdMoves(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing square. Usage: moves <square>");
        return false;
    }

    chess::SquareResult square = chess::squareFromName(CommandParser::toLower(args[0]));
    if (!square) {
        output("Invalid square coordinates: " + square.message());
        return false;
    }

    std::vector<std::string> destinations = api::legalDestinations(*currentState_, CommandParser::toLower(args[0]));
    if (destinations.empty()) {
        output("No legal moves from " + args[0]);
        return true;
    }

    std::ostringstream ss;
    ss << "Legal moves from " << args[0] << ":";
    for (const auto& name : destinations) {
        ss << " " << name;
    }
    output(ss.str());
    return true;
}

bool CLIInterface::cmdBoard(const std::vector<std::string>& /*args*/) {
    output(currentState_->toString());
    return true;
}

bool CLIInterface::cmdFen(const std::vector<std::string>& /*args*/) {
    output(currentState_->toFEN());
    return true;
}

bool CLIInterface::cmdHistory(const std::vector<std::string>& /*args*/) {
    const auto& history = currentState_->getMoveHistory();
    if (history.empty()) {
        output("No moves played.");
        return true;
    }

    for (size_t i = 0; i < history.size(); ++i) {
        const chess::MoveRecord& move = history[i];
        std::ostringstream ss;
        ss << (i + 1) << ". " << chess::pieceSymbol(move.piece) << " "
           << chess::squareName(move.from_square) << "-" << chess::squareName(move.to_square);
        if (move.promotion_piece != chess::PieceType::NONE) {
            ss << "=" << chess::pieceSymbol(chess::Piece(move.promotion_piece, move.piece.color));
        }
        output(ss.str());
    }
    return true;
}

bool CLIInterface::cmdCaptured(const std::vector<std::string>& /*args*/) {
    std::string byWhite = currentState_->capturedSymbols(chess::PieceColor::WHITE);
    std::string byBlack = currentState_->capturedSymbols(chess::PieceColor::BLACK);
    output("Captured by White: " + (byWhite.empty() ? std::string("-") : byWhite));
    output("Captured by Black: " + (byBlack.empty() ? std::string("-") : byBlack));
    return true;
}

bool CLIInterface::cmdSave(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing filename. Usage: save <filename>");
        return false;
    }

    selfplay::GameRecord record = selfplay::GameRecord::fromState(
        *currentState_, startingFen_, config_.white, config_.black);
    if (!record.saveToFile(args[0])) {
        output("Error saving game to file: " + args[0]);
        return false;
    }

    output("Game saved to " + args[0]);
    return true;
}

bool CLIInterface::cmdLoad(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing filename. Usage: load <filename>");
        return false;
    }

    try {
        selfplay::GameRecord record = selfplay::GameRecord::loadFromFile(args[0]);
        currentState_ = record.replay();
        startingFen_ = record.getStartingFen();
        announcedEnd_ = false;
    } catch (const std::runtime_error& e) {
        output(std::string("Error loading game: ") + e.what());
        return false;
    }

    output("Game loaded from " + args[0]);
    output(currentState_->toString());
    announceIfOver();
    return true;
}

bool CLIInterface::cmdQuit(const std::vector<std::string>& /*args*/) {
    output("Goodbye!");
    running_ = false;
    return true;
}

} // namespace cli
} // namespace gambit

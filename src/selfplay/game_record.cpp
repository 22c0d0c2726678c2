// src/selfplay/game_record.cpp
#include "gambit/selfplay/game_record.h"
#include "gambit/games/chess/square.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace gambit {
namespace selfplay {

using json = nlohmann::json;

namespace {

char promotionLetter(chess::PieceType type) {
    switch (type) {
        case chess::PieceType::QUEEN:  return 'q';
        case chess::PieceType::ROOK:   return 'r';
        case chess::PieceType::BISHOP: return 'b';
        case chess::PieceType::KNIGHT: return 'n';
        default:                       return '\0';
    }
}

std::string symbolString(char symbol) {
    return symbol == '\0' ? std::string() : std::string(1, symbol);
}

char symbolFromString(const std::string& text) {
    if (text.empty()) {
        return '\0';
    }
    if (text.size() != 1) {
        throw std::runtime_error("Expected a single-letter symbol, got '" + text + "'");
    }
    return text[0];
}

} // namespace

GameRecord::GameRecord(const std::string& startingFen,
                       const std::string& whitePlayer,
                       const std::string& blackPlayer)
    : startingFen_(startingFen.empty() ? chess::ChessState::STARTING_FEN : startingFen),
      whitePlayer_(whitePlayer), blackPlayer_(blackPlayer),
      result_(chess::GameStatus::IN_PROGRESS), timestamp_(std::chrono::system_clock::now()) {
}

GameRecord GameRecord::fromState(const chess::ChessState& state,
                                 const std::string& startingFen,
                                 const std::string& whitePlayer,
                                 const std::string& blackPlayer) {
    GameRecord record(startingFen, whitePlayer, blackPlayer);
    for (const auto& move : state.getMoveHistory()) {
        record.addMove(move);
    }
    record.setCaptured(state.capturedSymbols(chess::PieceColor::WHITE),
                       state.capturedSymbols(chess::PieceColor::BLACK));
    record.setResult(state.getStatus());
    return record;
}

void GameRecord::addMove(const chess::MoveRecord& move) {
    MoveData data;
    data.from = chess::squareName(move.from_square);
    data.to = chess::squareName(move.to_square);
    data.piece = chess::pieceSymbol(move.piece);
    data.promotion = promotionLetter(move.promotion_piece);
    moves_.push_back(data);
}

void GameRecord::setCaptured(const std::string& byWhite, const std::string& byBlack) {
    capturedByWhite_ = byWhite;
    capturedByBlack_ = byBlack;
}

std::unique_ptr<chess::ChessState> GameRecord::replay() const {
    auto state = std::make_unique<chess::ChessState>();
    if (!state->setFromFEN(startingFen_)) {
        throw std::runtime_error("Invalid starting position in record: " + startingFen_);
    }

    for (size_t i = 0; i < moves_.size(); ++i) {
        const MoveData& move = moves_[i];
        chess::MoveOutcome outcome = state->makeMove(move.from, move.to, move.promotion);
        if (!outcome.success) {
            throw std::runtime_error("Replay failed at move " + std::to_string(i + 1) + " (" +
                                     move.from + move.to + "): " + outcome.message);
        }
    }

    return state;
}

std::string GameRecord::toJson() const {
    json j;
    j["starting_fen"] = startingFen_;
    j["white"] = whitePlayer_;
    j["black"] = blackPlayer_;
    j["result"] = resultToString(result_);
    j["captured_by_white"] = capturedByWhite_;
    j["captured_by_black"] = capturedByBlack_;

    // Convert timestamp to ISO string
    auto time_t = std::chrono::system_clock::to_time_t(timestamp_);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    j["timestamp"] = ss.str();

    // Convert moves to JSON
    json moves_json = json::array();
    for (const auto& move : moves_) {
        json move_json;
        move_json["from"] = move.from;
        move_json["to"] = move.to;
        move_json["piece"] = symbolString(move.piece);
        if (move.promotion != '\0') {
            move_json["promotion"] = symbolString(move.promotion);
        }
        moves_json.push_back(move_json);
    }
    j["moves"] = moves_json;

    return j.dump(4);  // Pretty print with 4-space indent
}

GameRecord GameRecord::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        GameRecord record(j.at("starting_fen").get<std::string>(),
                          j.value("white", std::string("human")),
                          j.value("black", std::string("human")));
        record.result_ = resultFromString(j.at("result").get<std::string>());
        record.capturedByWhite_ = j.value("captured_by_white", std::string());
        record.capturedByBlack_ = j.value("captured_by_black", std::string());

        // Parse moves
        for (const auto& move_json : j.at("moves")) {
            MoveData move;
            move.from = move_json.at("from").get<std::string>();
            move.to = move_json.at("to").get<std::string>();
            move.piece = symbolFromString(move_json.value("piece", std::string(".")));
            move.promotion = symbolFromString(move_json.value("promotion", std::string()));
            record.moves_.push_back(move);
        }

        return record;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
}

bool GameRecord::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        spdlog::error("GameRecord: Could not open {} for writing", filename);
        return false;
    }

    file << toJson();
    if (!file) {
        spdlog::error("GameRecord: Failed writing {}", filename);
        return false;
    }

    spdlog::info("GameRecord: Saved {} moves to {}", moves_.size(), filename);
    return true;
}

GameRecord GameRecord::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        return fromJson(buffer.str());
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load game record: " + std::string(e.what()));
    }
}

std::string GameRecord::resultToString(chess::GameStatus result) {
    switch (result) {
        case chess::GameStatus::IN_PROGRESS:    return "in_progress";
        case chess::GameStatus::WHITE_WINS:     return "white_wins";
        case chess::GameStatus::BLACK_WINS:     return "black_wins";
        case chess::GameStatus::DRAW_STALEMATE: return "draw_stalemate";
    }
    return "in_progress";
}

chess::GameStatus GameRecord::resultFromString(const std::string& text) {
    if (text == "in_progress") return chess::GameStatus::IN_PROGRESS;
    if (text == "white_wins") return chess::GameStatus::WHITE_WINS;
    if (text == "black_wins") return chess::GameStatus::BLACK_WINS;
    if (text == "draw_stalemate") return chess::GameStatus::DRAW_STALEMATE;
    throw std::runtime_error("Unknown game result: '" + text + "'");
}

} // namespace selfplay
} // namespace gambit

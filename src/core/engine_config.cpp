// src/core/engine_config.cpp
#include "gambit/core/engine_config.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace gambit {
namespace core {

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it != j.end()) {
        field = it->template get<T>();
    }
}

} // namespace

std::string EngineConfig::toJson() const {
    json j;
    j["white"] = white;
    j["black"] = black;
    j["seed"] = seed;
    j["log_level"] = log_level;
    j["starting_fen"] = starting_fen;
    j["max_plies"] = max_plies;
    j["record_path"] = record_path;
    return j.dump(4);
}

EngineConfig EngineConfig::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Configuration must be a JSON object");
        }

        EngineConfig config;
        readField(j, "white", config.white);
        readField(j, "black", config.black);
        readField(j, "seed", config.seed);
        readField(j, "log_level", config.log_level);
        readField(j, "starting_fen", config.starting_fen);
        readField(j, "max_plies", config.max_plies);
        readField(j, "record_path", config.record_path);
        return config;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
}

bool EngineConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        spdlog::error("EngineConfig: Could not open {} for writing", filename);
        return false;
    }

    file << toJson();
    return static_cast<bool>(file);
}

EngineConfig EngineConfig::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        return fromJson(buffer.str());
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load configuration: " + std::string(e.what()));
    }
}

std::string EngineConfig::validate() const {
    if (!isValidPlayerKind(white)) {
        return "Invalid player kind for white: " + white;
    }
    if (!isValidPlayerKind(black)) {
        return "Invalid player kind for black: " + black;
    }
    if (!isValidLogLevel(log_level)) {
        return "Invalid log level: " + log_level;
    }
    if (max_plies < 0) {
        return "max_plies must not be negative";
    }
    return "";
}

bool EngineConfig::isValidPlayerKind(const std::string& kind) {
    return kind == "human" || kind == "random" || kind == "greedy";
}

bool EngineConfig::isValidLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "error" || level == "off";
}

} // namespace core
} // namespace gambit

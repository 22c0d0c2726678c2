// include/gambit/core/engine_config.h
#ifndef GAMBIT_ENGINE_CONFIG_H
#define GAMBIT_ENGINE_CONFIG_H

#include <string>

namespace gambit {
namespace core {

/**
 * @brief Settings of a game session
 *
 * Player kinds are "human", "random" or "greedy". A max_plies of 0 means the
 * game runs until it ends. An empty record_path disables saving the record.
 */
struct EngineConfig {
    std::string white = "human";
    std::string black = "greedy";
    unsigned int seed = 0;              // 0 for a time-based seed
    std::string log_level = "info";
    std::string starting_fen;           // Empty for the standard position
    int max_plies = 0;
    std::string record_path;

    /**
     * @brief Serialize to JSON
     *
     * @return JSON string representation
     */
    std::string toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * Missing keys keep their defaults and unknown keys are ignored.
     *
     * @param json JSON string
     * @return EngineConfig object
     * @throws std::runtime_error on malformed JSON or a value of the wrong type
     */
    static EngineConfig fromJson(const std::string& json);

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
     * @return EngineConfig object
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig loadFromFile(const std::string& filename);

    /**
     * @brief Check player kinds, seed and log level
     *
     * @return Empty string if valid, otherwise a description of the problem
     */
    std::string validate() const;

    static bool isValidPlayerKind(const std::string& kind);
    static bool isValidLogLevel(const std::string& level);
};

} // namespace core
} // namespace gambit

#endif // GAMBIT_ENGINE_CONFIG_H

// include/gambit/cli/command_parser.h
#ifndef GAMBIT_COMMAND_PARSER_H
#define GAMBIT_COMMAND_PARSER_H

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace gambit {
namespace cli {

/**
 * @brief A move as typed by a user
 */
struct MoveInput {
    std::string from;
    std::string to;
    char promotion = '\0';
};

/**
 * @brief Command parser for the CLI
 *
 * This class provides utilities for parsing command-line flags and the
 * lines typed at the interactive prompt.
 */
class CommandParser {
public:
    /**
     * @brief Split a command line into tokens
     *
     * Double quotes group words, so a FEN can be passed as one token.
     *
     * @param line The input line to tokenize
     * @return Vector of tokens
     */
    static std::vector<std::string> tokenize(const std::string& line);

    /**
     * @brief Collect program arguments, skipping the program name
     */
    static std::vector<std::string> argumentsFrom(int argc, char* argv[]);

    /**
     * @brief Extract flags from arguments
     *
     * Accepts "--flag value", "--flag=value" and bare "--flag". Extracted
     * flags are removed from args.
     *
     * @param args Vector of arguments
     * @param flagPrefix Prefix for flags (e.g., "--" or "-")
     * @return Map of flags to values (empty string for boolean flags)
     */
    static std::map<std::string, std::string> extractFlags(
        std::vector<std::string>& args, const std::string& flagPrefix = "--");

    /**
     * @brief Check if a flag is present in a flag map
     */
    static bool hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag);

    /**
     * @brief Get flag value as string
     *
     * @param flags Map of flags
     * @param flag Flag to get
     * @param defaultValue Default value if flag is not present
     * @return Flag value or default value
     */
    static std::string getFlagValue(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        const std::string& defaultValue = "");

    /**
     * @brief Get flag value as int
     *
     * @param flags Map of flags
     * @param flag Flag to get
     * @param defaultValue Default value if flag is not present or conversion fails
     * @return Flag value as int or default value
     */
    static int getFlagValueInt(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        int defaultValue = 0);

    /**
     * @brief Parse a typed move
     *
     * Accepts "e2 e4", "e2 e4 q" and the joined form "e2e4" / "e7e8q".
     * Square names are not validated here.
     *
     * @param tokens Tokens of the input line
     * @return Move, or nothing if the tokens do not have a move shape
     */
    static std::optional<MoveInput> parseMove(const std::vector<std::string>& tokens);

    /**
     * @brief Lowercase copy of a string
     */
    static std::string toLower(const std::string& text);
};

} // namespace cli
} // namespace gambit

#endif // GAMBIT_COMMAND_PARSER_H

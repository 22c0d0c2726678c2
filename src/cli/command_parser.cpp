// src/cli/command_parser.cpp
#include "gambit/cli/command_parser.h"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gambit {
namespace cli {

namespace {

bool looksLikeSquare(const std::string& text) {
    return text.size() == 2 && std::isalpha(static_cast<unsigned char>(text[0])) &&
           std::isdigit(static_cast<unsigned char>(text[1]));
}

bool isPromotionToken(const std::string& text) {
    return text.size() == 1 && std::string("qrbnQRBN").find(text[0]) != std::string::npos;
}

} // namespace

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;

    bool inQuotes = false;
    std::string quotedToken;

    while (iss >> token) {
        if (!inQuotes) {
            if (token[0] == '"') {
                if (token.size() > 1 && token.back() == '"') {
                    // Token is "word" - remove quotes and add
                    tokens.push_back(token.substr(1, token.size() - 2));
                } else {
                    inQuotes = true;
                    quotedToken = token.substr(1);
                }
            } else {
                tokens.push_back(token);
            }
        } else if (token.back() == '"') {
            // Token ends the quoted string
            quotedToken += " " + token.substr(0, token.size() - 1);
            tokens.push_back(quotedToken);
            inQuotes = false;
            quotedToken.clear();
        } else {
            quotedToken += " " + token;
        }
    }

    // Handle unclosed quotes
    if (inQuotes) {
        tokens.push_back(quotedToken);
    }

    return tokens;
}

std::vector<std::string> CommandParser::argumentsFrom(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

std::map<std::string, std::string> CommandParser::extractFlags(
    std::vector<std::string>& args, const std::string& flagPrefix) {

    std::map<std::string, std::string> flags;
    auto it = args.begin();

    while (it != args.end()) {
        const std::string arg = *it;

        if (arg.size() <= flagPrefix.size() || arg.compare(0, flagPrefix.size(), flagPrefix) != 0) {
            ++it;
            continue;
        }

        std::string flag = arg.substr(flagPrefix.size());
        std::string value;

        size_t equalPos = flag.find('=');
        bool inlineValue = equalPos != std::string::npos;
        if (inlineValue) {
            value = flag.substr(equalPos + 1);
            flag = flag.substr(0, equalPos);
        }

        it = args.erase(it);

        // Next argument is not a flag, use it as value
        if (!inlineValue && it != args.end() && !it->empty() && (*it)[0] != '-') {
            value = *it;
            it = args.erase(it);
        }

        flags[flag] = value;
    }

    return flags;
}

bool CommandParser::hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag) {
    return flags.find(flag) != flags.end();
}

std::string CommandParser::getFlagValue(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    const std::string& defaultValue) {

    auto it = flags.find(flag);
    if (it != flags.end()) {
        return it->second;
    }

    return defaultValue;
}

int CommandParser::getFlagValueInt(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    int defaultValue) {

    auto it = flags.find(flag);
    if (it == flags.end()) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        return consumed == it->second.size() ? value : defaultValue;
    } catch (const std::invalid_argument&) {
        return defaultValue;
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}

std::optional<MoveInput> CommandParser::parseMove(const std::vector<std::string>& tokens) {
    if (tokens.empty() || tokens.size() > 3) {
        return std::nullopt;
    }

    MoveInput move;

    if (tokens.size() == 1) {
        // Joined form: e2e4 or e7e8q
        const std::string text = toLower(tokens[0]);
        if (text.size() != 4 && text.size() != 5) {
            return std::nullopt;
        }
        move.from = text.substr(0, 2);
        move.to = text.substr(2, 2);
        if (text.size() == 5) {
            if (!isPromotionToken(text.substr(4))) {
                return std::nullopt;
            }
            move.promotion = text[4];
        }
    } else {
        move.from = toLower(tokens[0]);
        move.to = toLower(tokens[1]);
        if (tokens.size() == 3) {
            if (!isPromotionToken(tokens[2])) {
                return std::nullopt;
            }
            move.promotion = static_cast<char>(std::tolower(static_cast<unsigned char>(tokens[2][0])));
        }
    }

    if (!looksLikeSquare(move.from) || !looksLikeSquare(move.to)) {
        return std::nullopt;
    }
    return move;
}

std::string CommandParser::toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace cli
} // namespace gambit

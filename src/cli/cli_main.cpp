// src/cli/cli_main.cpp
#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "gambit/cli/cli_interface.h"
#include "gambit/cli/command_parser.h"
#include "gambit/core/engine_config.h"

using namespace gambit;

namespace {

void showHelp() {
    std::cout << "Usage: gambit_cli [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE     Load settings from a JSON file" << std::endl;
    std::cout << "  --white KIND      White player: human, random, greedy (default: human)" << std::endl;
    std::cout << "  --black KIND      Black player: human, random, greedy (default: greedy)" << std::endl;
    std::cout << "  --fen FEN         Starting position (placement field required)" << std::endl;
    std::cout << "  --seed N          Random seed, 0 for time-based (default: 0)" << std::endl;
    std::cout << "  --max-plies N     Stop after N plies, 0 for no limit (default: 0)" << std::endl;
    std::cout << "  --record FILE     Save the game record to FILE on exit" << std::endl;
    std::cout << "  --log-level L     trace, debug, info, warn, error, off (default: info)" << std::endl;
    std::cout << "  --help            Show this help message" << std::endl;
}

// Flags given on the command line override the configuration file
void applyFlags(core::EngineConfig& config, const std::map<std::string, std::string>& flags) {
    using cli::CommandParser;

    config.white = CommandParser::getFlagValue(flags, "white", config.white);
    config.black = CommandParser::getFlagValue(flags, "black", config.black);
    config.starting_fen = CommandParser::getFlagValue(flags, "fen", config.starting_fen);
    config.record_path = CommandParser::getFlagValue(flags, "record", config.record_path);
    config.log_level = CommandParser::getFlagValue(flags, "log-level", config.log_level);
    config.max_plies = CommandParser::getFlagValueInt(flags, "max-plies", config.max_plies);

    if (CommandParser::hasFlag(flags, "seed")) {
        int seed = CommandParser::getFlagValueInt(flags, "seed", -1);
        if (seed < 0) {
            throw std::runtime_error("Invalid seed: " + CommandParser::getFlagValue(flags, "seed"));
        }
        config.seed = static_cast<unsigned int>(seed);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args = cli::CommandParser::argumentsFrom(argc, argv);
    std::map<std::string, std::string> flags = cli::CommandParser::extractFlags(args);

    if (cli::CommandParser::hasFlag(flags, "help") || cli::CommandParser::hasFlag(flags, "h")) {
        showHelp();
        return 0;
    }

    if (!args.empty()) {
        std::cerr << "Unexpected argument: " << args[0] << std::endl;
        showHelp();
        return 1;
    }

    try {
        core::EngineConfig config;
        if (cli::CommandParser::hasFlag(flags, "config")) {
            config = core::EngineConfig::loadFromFile(cli::CommandParser::getFlagValue(flags, "config"));
        }
        applyFlags(config, flags);

        if (!core::EngineConfig::isValidLogLevel(config.log_level)) {
            throw std::runtime_error("Invalid log level: " + config.log_level);
        }
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::debug("CLI: Configuration {}", config.toJson());

        cli::CLIInterface cli(config);
        return cli.run();
    } catch (const std::exception& e) {
        spdlog::error("CLI: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

// include/gambit/core/exceptions.h
#ifndef GAMBIT_EXCEPTIONS_H
#define GAMBIT_EXCEPTIONS_H

#include <string>
#include <stdexcept>

namespace gambit {
namespace core {

/**
 * @brief Exception for invalid engine construction or game setup
 */
class GameStateException : public std::runtime_error {
public:
    explicit GameStateException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for an unknown move-selection strategy name
 */
class UnknownStrategyException : public GameStateException {
public:
    explicit UnknownStrategyException(const std::string& name)
        : GameStateException("Unknown strategy: '" + name + "'"), name_(name) {}
    const std::string& getName() const { return name_; }
private:
    std::string name_;
};

} // namespace core
} // namespace gambit

#endif // GAMBIT_EXCEPTIONS_H

// include/gambit/games/chess/square.h
#ifndef GAMBIT_SQUARE_H
#define GAMBIT_SQUARE_H

#include <string>
#include <optional>

namespace gambit {
namespace chess {

/**
 * @brief Reason an algebraic square name or coordinate pair was rejected
 */
enum class SquareError {
    NONE,
    BAD_LENGTH,     // Name is not exactly two characters
    BAD_FILE,       // File letter outside a-h, or column outside [0,8)
    BAD_RANK        // Rank digit outside 1-8, or row outside [0,8)
};

/**
 * @brief Result of a square conversion
 *
 * Holds either a square index (0 = a8, 63 = h1) or the reason the input was
 * rejected. Callers must test the result before using the square.
 */
class SquareResult {
public:
    static SquareResult ok(int square) { return SquareResult(square, SquareError::NONE); }
    static SquareResult fail(SquareError error) { return SquareResult(-1, error); }

    bool has_value() const { return error_ == SquareError::NONE; }
    explicit operator bool() const { return has_value(); }

    int value() const { return square_; }
    SquareError error() const { return error_; }

    /**
     * @brief Human readable reason, empty on success
     */
    std::string message() const;

private:
    SquareResult(int square, SquareError error) : square_(square), error_(error) {}

    int square_;
    SquareError error_;
};

/**
 * @brief Convert an algebraic name such as "e2" to a square index
 */
SquareResult squareFromName(const std::string& name);

/**
 * @brief Convert a (row, column) pair to a square index
 */
SquareResult squareFromCoords(int row, int col);

/**
 * @brief Convert a square index to its algebraic name
 *
 * @return Empty optional if the index is off the board
 */
std::optional<std::string> squareToName(int square);

/**
 * @brief Algebraic name of a square, or "-" when off the board
 */
std::string squareName(int square);

} // namespace chess
} // namespace gambit

#endif // GAMBIT_SQUARE_H

// src/games/chess/square.cpp
#include "gambit/games/chess/square.h"
#include "gambit/games/chess/chess_types.h"

namespace gambit {
namespace chess {

std::string SquareResult::message() const {
    switch (error_) {
        case SquareError::NONE:       return "";
        case SquareError::BAD_LENGTH: return "square name must be a file letter and a rank digit";
        case SquareError::BAD_FILE:   return "file out of range";
        case SquareError::BAD_RANK:   return "rank out of range";
    }
    return "unknown error";
}

SquareResult squareFromName(const std::string& name) {
    if (name.length() != 2) {
        return SquareResult::fail(SquareError::BAD_LENGTH);
    }

    char fileChar = name[0];
    char rankChar = name[1];

    if (fileChar < 'a' || fileChar > 'h') {
        return SquareResult::fail(SquareError::BAD_FILE);
    }
    if (rankChar < '1' || rankChar > '8') {
        return SquareResult::fail(SquareError::BAD_RANK);
    }

    int col = fileChar - 'a';
    int row = '8' - rankChar;
    return SquareResult::ok(getSquare(row, col));
}

SquareResult squareFromCoords(int row, int col) {
    if (row < 0 || row >= BOARD_SIZE) {
        return SquareResult::fail(SquareError::BAD_RANK);
    }
    if (col < 0 || col >= BOARD_SIZE) {
        return SquareResult::fail(SquareError::BAD_FILE);
    }
    return SquareResult::ok(getSquare(row, col));
}

std::optional<std::string> squareToName(int square) {
    if (!isValidSquare(square)) {
        return std::nullopt;
    }

    char fileChar = static_cast<char>('a' + getFile(square));
    char rankChar = static_cast<char>('8' - getRank(square));
    return std::string({fileChar, rankChar});
}

std::string squareName(int square) {
    return squareToName(square).value_or("-");
}

} // namespace chess
} // namespace gambit

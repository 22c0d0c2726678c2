// src/games/chess/chess_types.cpp
#include "gambit/games/chess/chess_types.h"
#include <cctype>

namespace gambit {
namespace chess {

const char* const MSG_MOVE_SUCCESSFUL = "Move Successful";
const char* const MSG_ILLEGAL_MOVE = "Illegal Move";
const char* const MSG_GAME_OVER = "Game Over";

char pieceSymbol(const Piece& piece) {
    char symbol;
    switch (piece.type) {
        case PieceType::PAWN:   symbol = 'p'; break;
        case PieceType::KNIGHT: symbol = 'n'; break;
        case PieceType::BISHOP: symbol = 'b'; break;
        case PieceType::ROOK:   symbol = 'r'; break;
        case PieceType::QUEEN:  symbol = 'q'; break;
        case PieceType::KING:   symbol = 'k'; break;
        default:                return '.';
    }

    if (piece.color == PieceColor::WHITE) {
        symbol = static_cast<char>(std::toupper(symbol));
    }
    return symbol;
}

Piece pieceFromSymbol(char symbol) {
    Piece piece;
    switch (std::tolower(static_cast<unsigned char>(symbol))) {
        case 'p': piece.type = PieceType::PAWN; break;
        case 'n': piece.type = PieceType::KNIGHT; break;
        case 'b': piece.type = PieceType::BISHOP; break;
        case 'r': piece.type = PieceType::ROOK; break;
        case 'q': piece.type = PieceType::QUEEN; break;
        case 'k': piece.type = PieceType::KING; break;
        default: return Piece();
    }

    piece.color = std::isupper(static_cast<unsigned char>(symbol)) ? PieceColor::WHITE : PieceColor::BLACK;
    return piece;
}

PieceType promotionFromChar(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'q': return PieceType::QUEEN;
        case 'r': return PieceType::ROOK;
        case 'b': return PieceType::BISHOP;
        case 'n': return PieceType::KNIGHT;
        default:  return PieceType::NONE;
    }
}

std::string colorName(PieceColor color) {
    switch (color) {
        case PieceColor::WHITE: return "White";
        case PieceColor::BLACK: return "Black";
        default:                return "None";
    }
}

std::string statusToString(GameStatus status) {
    switch (status) {
        case GameStatus::IN_PROGRESS:    return "In Progress";
        case GameStatus::WHITE_WINS:     return "White Wins!";
        case GameStatus::BLACK_WINS:     return "Black Wins!";
        case GameStatus::DRAW_STALEMATE: return "Draw - Stalemate";
    }
    return "Unknown";
}

} // namespace chess
} // namespace gambit

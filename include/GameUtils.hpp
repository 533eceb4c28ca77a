#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include "Board.hpp"
#include <string>
#include <vector>

// Forward declarations
class TicTacToeGame;
class AdaptiveEngine;

class GameUtils {
public:
    // Move parsing/display. Accepts "1".."9" (row-major) or "a1".."c3"
    // (column letter, row number from the top). Returns Board::NO_MOVE if
    // the text names no cell.
    static int parseMove(const char* move);
    static std::string displayMove(int cell);

    // Game string parsing, e.g. "1. b2 a1 2. c3". Move numbers ending in
    // '.' are skipped. False on the first unparsable move.
    static bool parseGameString(const char* gameStr, std::vector<int>& moves);

    static bool parseDifficulty(const std::string& text, Difficulty& out);
    static bool parseVariant(const std::string& text, Variant& out);
    static const char* difficultyName(Difficulty difficulty);
    static const char* variantName(Variant variant);

    // Board printing
    static void printBoard(const Board& board);
    static void printGameState(const TicTacToeGame& game);
    static void printLearningStats(const AdaptiveEngine& engine);

    // Number formatting
    static std::string formatWithCommas(int value);
};

#endif // GAMEUTILS_HPP

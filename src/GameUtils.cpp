#include "GameUtils.hpp"
#include "AdaptiveEngine.hpp"
#include "TicTacToeGame.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

int GameUtils::parseMove(const char* move) {
    if (move == nullptr) {
        return Board::NO_MOVE;
    }
    size_t len = strlen(move);

    if (len == 1 && move[0] >= '1' && move[0] <= '9') {
        return move[0] - '1';
    }
    if (len == 2) {
        char colChar = static_cast<char>(std::tolower(static_cast<unsigned char>(move[0])));
        char rowChar = move[1];
        if (colChar >= 'a' && colChar <= 'c' && rowChar >= '1' && rowChar <= '3') {
            return (rowChar - '1') * 3 + (colChar - 'a');
        }
    }
    return Board::NO_MOVE;
}

std::string GameUtils::displayMove(int cell) {
    if (!Board::isValidIndex(cell)) {
        return "--";
    }
    char colChar = static_cast<char>('a' + cell % 3);
    char rowChar = static_cast<char>('1' + cell / 3);
    return std::string(1, colChar) + rowChar;
}

bool GameUtils::parseGameString(const char* gameStr, std::vector<int>& moves) {
    moves.clear();
    std::istringstream in(gameStr ? gameStr : "");
    std::string token;

    while (in >> token) {
        // Skip move numbers ("1.", "2.", etc.)
        if (token.back() == '.') {
            continue;
        }
        int cell = parseMove(token.c_str());
        if (cell == Board::NO_MOVE) {
            return false;
        }
        moves.push_back(cell);
    }
    return true;
}

bool GameUtils::parseDifficulty(const std::string& text, Difficulty& out) {
    if (text == "easy") {
        out = Difficulty::EASY;
    } else if (text == "medium") {
        out = Difficulty::MEDIUM;
    } else if (text == "hard") {
        out = Difficulty::HARD;
    } else {
        return false;
    }
    return true;
}

bool GameUtils::parseVariant(const std::string& text, Variant& out) {
    if (text == "classic") {
        out = Variant::CLASSIC;
    } else if (text == "limited") {
        out = Variant::LIMITED;
    } else {
        return false;
    }
    return true;
}

const char* GameUtils::difficultyName(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::EASY: return "easy";
    case Difficulty::MEDIUM: return "medium";
    case Difficulty::HARD: return "hard";
    }
    return "unknown";
}

const char* GameUtils::variantName(Variant variant) {
    return variant == Variant::LIMITED ? "limited" : "classic";
}

void GameUtils::printBoard(const Board& board) {
    std::cout << "   a   b   c\n";
    for (int row = 0; row < 3; row++) {
        std::cout << (row + 1) << " ";
        for (int col = 0; col < 3; col++) {
            int cell = row * 3 + col;
            char c = Board::toChar(board.get(cell));
            std::cout << " " << (c == '-' ? ' ' : c) << " ";
            if (col < 2) std::cout << "|";
        }
        std::cout << "\n";
        if (row < 2) std::cout << "  ---+---+---\n";
    }
}

void GameUtils::printGameState(const TicTacToeGame& game) {
    printBoard(game.getBoard());

    if (game.isLimited()) {
        for (Board::Mark player : {Board::X, Board::O}) {
            std::cout << Board::toChar(player) << " pieces:";
            for (int cell : game.getHistory(player).moves()) {
                std::cout << " " << displayMove(cell);
            }
            std::cout << "\n";
        }
        int eviction = game.getNextEviction();
        if (eviction != Board::NO_MOVE) {
            std::cout << "Next move removes " << displayMove(eviction) << "\n";
        }
    }

    if (!game.isGameOver()) {
        std::cout << "Current player: " << Board::toChar(game.getCurrentPlayer()) << "\n";
    }
}

void GameUtils::printLearningStats(const AdaptiveEngine& engine) {
    StrategySelector::BanditStats bandit = engine.getBanditStats();
    OpponentModel::BayesianStats bayesian = engine.getBayesianStats();

    auto best = std::max_element(bandit.strategies.begin(), bandit.strategies.end(),
        [](const StrategySelector::ArmStats& a, const StrategySelector::ArmStats& b) {
            return a.expectedValue < b.expectedValue;
        });

    std::cout << "\n=== Learning ===\n";
    if (best != bandit.strategies.end()) {
        std::cout << "Leading strategy: " << best->name << " (E[p] = "
                  << std::fixed << std::setprecision(3) << best->expectedValue << ")\n";
    }
    std::cout << "Opponent patterns: " << formatWithCommas(bayesian.totalPatterns) << "\n";

    int shown = 0;
    for (const auto& detail : bayesian.patternDetails) {
        if (shown++ == 5) break;
        std::cout << "  " << detail.boardState << "  obs " << detail.observations << ":";
        for (const auto& mp : detail.probabilities) {
            if (mp.probability >= 0.1) {
                std::cout << " " << displayMove(mp.move) << "="
                          << std::setprecision(2) << mp.probability;
            }
        }
        std::cout << "\n";
    }
    std::cout << "================\n\n";
}

std::string GameUtils::formatWithCommas(int value) {
    std::string num = std::to_string(value < 0 ? -static_cast<long long>(value) : value);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

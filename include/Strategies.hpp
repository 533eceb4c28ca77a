#ifndef STRATEGIES_HPP
#define STRATEGIES_HPP

#include "Board.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

// Arms of the strategy bandit, in their fixed sampling order
enum class Strategy : uint8_t {
    MINIMAX = 0,
    MCTS,
    BAYESIAN,
    AGGRESSIVE,
    DEFENSIVE,
    CORNERS,
    CENTER,
    RANDOM
};

constexpr int NUM_STRATEGIES = 8;

constexpr std::array<Strategy, NUM_STRATEGIES> ALL_STRATEGIES = {
    Strategy::MINIMAX, Strategy::MCTS, Strategy::BAYESIAN, Strategy::AGGRESSIVE,
    Strategy::DEFENSIVE, Strategy::CORNERS, Strategy::CENTER, Strategy::RANDOM
};

const char* strategyName(Strategy strategy);
std::optional<Strategy> parseStrategy(const std::string& name);

// ============================================================================
// Strategies - fixed move heuristics
// ============================================================================
// These run after the shared win/block check, so none of them repeats it.
// Each returns Board::NO_MOVE only on a board without empty cells.

class Strategies {
public:
    // Fork, centre, best corner by open lines, random side, random cell
    static int aggressive(const Board& board, Board::Mark ai, std::mt19937& rng);

    // Block the opponent's fork, centre, then the cell that leaves the
    // opponent the fewest open lines
    static int defensive(const Board& board, Board::Mark ai);

    // Corners 0, 8, 2, 6, then centre, first side, first cell
    static int corners(const Board& board);

    // Centre, corner opposite an opponent corner, random corner, random
    // side, random cell
    static int center(const Board& board, Board::Mark ai, std::mt19937& rng);

    static int random(const Board& board, std::mt19937& rng);

    // +1 per line free of opponent marks after `ai` takes `cell`, +3 more
    // when that line then holds two of `ai`.
    static int openLineScore(const Board& board, Board::Mark ai, int cell);

    // +1 per line still open to the opponent after `ai` takes `cell`, +5
    // more when that line holds two opponent marks.
    static int opponentOpportunities(const Board& board, Board::Mark ai, int cell);

private:
    template <size_t N>
    static int pickRandomEmpty(const Board& board, const int (&cells)[N], std::mt19937& rng);
};

#endif // STRATEGIES_HPP

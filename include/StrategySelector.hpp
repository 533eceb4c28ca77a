#ifndef STRATEGYSELECTOR_HPP
#define STRATEGYSELECTOR_HPP

#include "Board.hpp"
#include "LoadResult.hpp"
#include "Strategies.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

class LimitedSearch;
class MCTS;
class Minimax;
class OpponentModel;

// ============================================================================
// StrategySelector - Thompson sampling over the eight move strategies
// ============================================================================

class StrategySelector {
public:
    enum class Outcome : uint8_t { WIN, LOSS, DRAW };

    struct Config {
        uint32_t seed = std::random_device{}();

        Config() {}
    };

    // Seeded at one of each outcome so no arm starts at zero
    struct StrategyStats {
        int wins = 1;
        int losses = 1;
        int draws = 1;
        int total = 3;
        double alpha = 1.0;
        double beta = 1.0;
    };

    struct ArmStats {
        std::string name;
        int wins = 0;
        int losses = 0;
        int draws = 0;
        int total = 0;
        double winRate = 0.0;
        double alpha = 1.0;
        double beta = 1.0;
        double expectedValue = 0.5;
    };

    struct BanditStats {
        std::vector<ArmStats> strategies;
        std::optional<std::string> currentStrategy;
    };

    // The searches and the model are borrowed and must outlive the selector.
    StrategySelector(Minimax& minimax, LimitedSearch& limitedSearch, MCTS& mcts,
                     const OpponentModel& opponentModel, const Config& config = Config());

    // Samples every arm and keeps the highest (first arm on ties).
    Strategy selectStrategy();

    // Credits the current arm with the game result. No-op without one.
    void recordOutcome(Board::Mark winner, Board::Mark aiMark);
    void update(Strategy strategy, Outcome outcome);

    // Move from one named strategy. Every strategy takes an immediate win
    // or block first.
    int move(Strategy strategy, const Board& board, Board::Mark aiMark, Variant variant,
             const PieceHistory& aiHistory, const PieceHistory& oppHistory,
             Difficulty difficulty = Difficulty::HARD);

    // selectStrategy followed by move.
    int chooseMove(const Board& board, Board::Mark aiMark, Variant variant,
                   const PieceHistory& aiHistory, const PieceHistory& oppHistory,
                   Difficulty difficulty = Difficulty::HARD);

    std::optional<Strategy> getCurrentStrategy() const { return current_; }
    const StrategyStats& getArm(Strategy strategy) const {
        return arms_[static_cast<size_t>(strategy)];
    }

    void reset();
    BanditStats getStats() const;
    // Replaces the arm statistics. Unknown names and invalid numbers are
    // skipped; arms missing from `stats` keep their seed values.
    LoadResult load(const BanditStats& stats);
    void printStats() const;

    // Ratio-of-powers approximation of a Beta(alpha, beta) draw.
    static double sampleBeta(double alpha, double beta, std::mt19937& rng);

private:
    Minimax& minimax_;
    LimitedSearch& limitedSearch_;
    MCTS& mcts_;
    const OpponentModel& opponentModel_;

    std::array<StrategyStats, NUM_STRATEGIES> arms_;
    std::optional<Strategy> current_;
    std::mt19937 rng_;
};

#endif // STRATEGYSELECTOR_HPP

#include "StrategySelector.hpp"
#include "BoardEvaluator.hpp"
#include "LimitedSearch.hpp"
#include "MCTS.hpp"
#include "Minimax.hpp"
#include "OpponentModel.hpp"
#include "Profiler.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

StrategySelector::StrategySelector(Minimax& minimax, LimitedSearch& limitedSearch, MCTS& mcts,
                                   const OpponentModel& opponentModel, const Config& config)
    : minimax_(minimax)
    , limitedSearch_(limitedSearch)
    , mcts_(mcts)
    , opponentModel_(opponentModel)
    , rng_(config.seed) {
    reset();
}

double StrategySelector::sampleBeta(double alpha, double beta, std::mt19937& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    double u = uniform(rng);
    double v = uniform(rng);
    double x = std::pow(u, 1.0 / alpha);
    double y = std::pow(v, 1.0 / beta);
    if (x + y <= 0.0) {
        return 0.5;
    }
    return x / (x + y);
}

Strategy StrategySelector::selectStrategy() {
    Strategy best = Strategy::MINIMAX;
    double highest = -1.0;

    for (Strategy strategy : ALL_STRATEGIES) {
        const StrategyStats& arm = arms_[static_cast<size_t>(strategy)];
        double sample = sampleBeta(arm.alpha, arm.beta, rng_);
        if (sample > highest) {
            highest = sample;
            best = strategy;
        }
    }

    current_ = best;
    return best;
}

void StrategySelector::update(Strategy strategy, Outcome outcome) {
    StrategyStats& arm = arms_[static_cast<size_t>(strategy)];
    switch (outcome) {
    case Outcome::WIN:
        arm.wins++;
        arm.alpha += 1.0;
        break;
    case Outcome::LOSS:
        arm.losses++;
        arm.beta += 1.0;
        break;
    case Outcome::DRAW:
        arm.draws++;
        arm.alpha += 0.5;
        arm.beta += 0.5;
        break;
    }
    arm.total++;
}

void StrategySelector::recordOutcome(Board::Mark winner, Board::Mark aiMark) {
    if (!current_) {
        return;
    }

    Outcome outcome = Outcome::LOSS;
    if (winner == Board::EMPTY) {
        outcome = Outcome::DRAW;
    } else if (winner == aiMark) {
        outcome = Outcome::WIN;
    }
    update(*current_, outcome);
}

int StrategySelector::move(Strategy strategy, const Board& board, Board::Mark aiMark, Variant variant,
                           const PieceHistory& aiHistory, const PieceHistory& oppHistory,
                           Difficulty difficulty) {
    PROFILE_SCOPE("StrategySelector::move");
    const bool limited = variant == Variant::LIMITED;
    const PieceHistory* own = limited ? &aiHistory : nullptr;
    const PieceHistory* opp = limited ? &oppHistory : nullptr;

    int tactical = BoardEvaluator::tacticalMove(board, aiMark, own, opp);
    if (tactical != Board::NO_MOVE) {
        return tactical;
    }

    switch (strategy) {
    case Strategy::MINIMAX:
        if (limited) {
            return limitedSearch_.bestMove(board, aiMark, aiHistory, oppHistory);
        }
        return minimax_.bestMove(board, aiMark, difficulty);

    case Strategy::MCTS:
        return mcts_.bestMove(board, aiMark, own, opp);

    case Strategy::BAYESIAN: {
        auto counter = opponentModel_.counterMove(board);
        if (counter && board.isLegalMove(*counter)) {
            return *counter;
        }
        // Not enough data for this position
        return mcts_.bestMove(board, aiMark, own, opp);
    }

    case Strategy::AGGRESSIVE:
        return Strategies::aggressive(board, aiMark, rng_);

    case Strategy::DEFENSIVE:
        return Strategies::defensive(board, aiMark);

    case Strategy::CORNERS:
        return Strategies::corners(board);

    case Strategy::CENTER:
        return Strategies::center(board, aiMark, rng_);

    case Strategy::RANDOM:
        return Strategies::random(board, rng_);
    }
    return Board::NO_MOVE;
}

int StrategySelector::chooseMove(const Board& board, Board::Mark aiMark, Variant variant,
                                 const PieceHistory& aiHistory, const PieceHistory& oppHistory,
                                 Difficulty difficulty) {
    Strategy strategy = selectStrategy();
    return move(strategy, board, aiMark, variant, aiHistory, oppHistory, difficulty);
}

void StrategySelector::reset() {
    arms_.fill(StrategyStats());
    current_.reset();
}

StrategySelector::BanditStats StrategySelector::getStats() const {
    BanditStats stats;
    stats.strategies.reserve(NUM_STRATEGIES);

    for (Strategy strategy : ALL_STRATEGIES) {
        const StrategyStats& arm = arms_[static_cast<size_t>(strategy)];
        ArmStats out;
        out.name = strategyName(strategy);
        out.wins = arm.wins;
        out.losses = arm.losses;
        out.draws = arm.draws;
        out.total = arm.total;
        out.winRate = arm.total > 0 ? static_cast<double>(arm.wins) / arm.total : 0.0;
        out.alpha = arm.alpha;
        out.beta = arm.beta;
        out.expectedValue = arm.alpha / (arm.alpha + arm.beta);
        stats.strategies.push_back(out);
    }

    if (current_) {
        stats.currentStrategy = std::string(strategyName(*current_));
    }
    return stats;
}

LoadResult StrategySelector::load(const BanditStats& stats) {
    std::array<StrategyStats, NUM_STRATEGIES> loaded;
    loaded.fill(StrategyStats());
    int accepted = 0;
    int skipped = 0;
    std::string diagnostic;

    for (const auto& arm : stats.strategies) {
        auto strategy = parseStrategy(arm.name);
        if (!strategy) {
            skipped++;
            diagnostic = "unknown strategy '" + arm.name + "'";
            continue;
        }
        bool validCounts = arm.wins >= 0 && arm.losses >= 0 && arm.draws >= 0 && arm.total >= 0;
        bool validParams = std::isfinite(arm.alpha) && std::isfinite(arm.beta) &&
                           arm.alpha > 0.0 && arm.beta > 0.0;
        if (!validCounts || !validParams) {
            skipped++;
            diagnostic = "invalid numbers for '" + arm.name + "'";
            continue;
        }

        StrategyStats& target = loaded[static_cast<size_t>(*strategy)];
        target.wins = arm.wins;
        target.losses = arm.losses;
        target.draws = arm.draws;
        target.total = arm.total;
        target.alpha = arm.alpha;
        target.beta = arm.beta;
        accepted++;
    }
    if (accepted == 0 && skipped > 0) {
        return LoadResult::fromCounts(accepted, skipped, diagnostic);
    }

    arms_ = loaded;
    current_.reset();
    if (stats.currentStrategy) {
        current_ = parseStrategy(*stats.currentStrategy);
    }
    return LoadResult::fromCounts(accepted, skipped, diagnostic);
}

void StrategySelector::printStats() const {
    std::cout << "\n=== Strategy Bandit ===\n";
    std::cout << std::left << std::setw(12) << "Strategy"
              << std::right << std::setw(6) << "Wins"
              << std::setw(8) << "Losses"
              << std::setw(7) << "Draws"
              << std::setw(7) << "Total"
              << std::setw(9) << "WinRate"
              << std::setw(8) << "Alpha"
              << std::setw(8) << "Beta"
              << std::setw(8) << "E[p]" << "\n";
    std::cout << std::string(73, '-') << "\n";

    for (const auto& arm : getStats().strategies) {
        std::cout << std::left << std::setw(12) << arm.name
                  << std::right << std::setw(6) << arm.wins
                  << std::setw(8) << arm.losses
                  << std::setw(7) << arm.draws
                  << std::setw(7) << arm.total
                  << std::setw(9) << std::fixed << std::setprecision(3) << arm.winRate
                  << std::setw(8) << std::setprecision(1) << arm.alpha
                  << std::setw(8) << arm.beta
                  << std::setw(8) << std::setprecision(3) << arm.expectedValue << "\n";
    }

    std::cout << "Current strategy: "
              << (current_ ? strategyName(*current_) : "none") << "\n";
    std::cout << "=======================\n\n";
}

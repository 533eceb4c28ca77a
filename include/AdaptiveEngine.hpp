#ifndef ADAPTIVEENGINE_HPP
#define ADAPTIVEENGINE_HPP

#include "Board.hpp"
#include "LearningStore.hpp"
#include "LimitedSearch.hpp"
#include "MCTS.hpp"
#include "Minimax.hpp"
#include "OpponentModel.hpp"
#include "StrategySelector.hpp"
#include <cstdint>
#include <random>
#include <string>

class TicTacToeGame;

// ============================================================================
// AdaptiveEngine - difficulty dispatch over the searches and learned models
// ============================================================================
// Owns every model. Drivers ask for moves, report the opponent's moves and
// game results, and persist the learned state through getLearningStore().

class AdaptiveEngine {
public:
    struct Config {
        double easyWinChance = 0.8;
        double easyBlockChance = 0.5;
        double easyCenterChance = 0.3;
        double mediumAdaptiveChance = 0.7;
        int mediumMctsIterations = 200;
        uint32_t seed = std::random_device{}();

        Minimax::Config minimax;
        LimitedSearch::Config limited;
        MCTS::Config mcts;
        StrategySelector::Config selector;

        Config() {}

        // Every random stream derived from one seed
        static Config seeded(uint32_t seed) {
            Config config;
            config.seed = seed;
            config.minimax.seed = seed + 1;
            config.mcts.seed = seed + 2;
            config.selector.seed = seed + 3;
            return config;
        }
    };

    explicit AdaptiveEngine(const Config& config = Config());

    // The selector and the store hold references into this object
    AdaptiveEngine(const AdaptiveEngine&) = delete;
    AdaptiveEngine& operator=(const AdaptiveEngine&) = delete;

    // Move for `aiMark`, or Board::NO_MOVE when the board has no empty cell.
    int computeMove(const Board& board, Board::Mark aiMark, Variant variant,
                    const PieceHistory& aiHistory, const PieceHistory& oppHistory,
                    Difficulty difficulty);
    // Move for the player to act in `game`.
    int computeMove(const TicTacToeGame& game, Difficulty difficulty);

    // Learning boundaries
    bool observePlayerMove(const Board& board, int move);
    void recordGameOutcome(Board::Mark winner, Board::Mark aiMark);

    StrategySelector::BanditStats getBanditStats() const { return selector_.getStats(); }
    OpponentModel::BayesianStats getBayesianStats() const { return model_.getStats(); }
    bool resetLearning(BlobStore* store = nullptr) { return store_.reset(store); }

    std::string serializeBandit() const { return store_.serializeBandit(); }
    std::string serializeBayesian() const { return store_.serializeBayesian(); }
    LoadResult deserializeBandit(const std::string& text) { return store_.deserializeBandit(text); }
    LoadResult deserializeBayesian(const std::string& text) { return store_.deserializeBayesian(text); }

    LearningStore& getLearningStore() { return store_; }
    StrategySelector& getSelector() { return selector_; }
    const OpponentModel& getOpponentModel() const { return model_; }
    MCTS& getMCTS() { return mcts_; }
    Minimax& getMinimax() { return minimax_; }

    // Which path produced the last move, e.g. "easy", "mcts-lite", or a
    // strategy name
    const std::string& getLastSource() const { return lastSource_; }
    const Config& getConfig() const { return config_; }

private:
    Config config_;
    OpponentModel model_;
    Minimax minimax_;
    LimitedSearch limitedSearch_;
    MCTS mcts_;
    StrategySelector selector_;
    LearningStore store_;
    std::mt19937 rng_;
    std::string lastSource_;

    int easyMove(const Board& board, Board::Mark aiMark, Variant variant,
                 const PieceHistory& aiHistory, const PieceHistory& oppHistory);
    int randomLegalMove(const Board& board);
    bool roll(double probability);
};

#endif // ADAPTIVEENGINE_HPP

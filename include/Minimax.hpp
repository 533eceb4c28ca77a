#ifndef MINIMAX_HPP
#define MINIMAX_HPP

#include "Board.hpp"
#include "TranspositionTable.hpp"
#include <cstdint>
#include <random>

class OpponentModel;

// ============================================================================
// Minimax - exact alpha-beta search for the classic variant
// ============================================================================

class Minimax {
public:
    static constexpr int WIN_SCORE = 10;
    // Every reachable score lies strictly inside (-SCORE_BOUND, SCORE_BOUND)
    static constexpr int SCORE_BOUND = 100;

    struct Config {
        double hardCounterRate = 0.9;
        double mediumCounterRate = 0.5;
        size_t maxCacheEntries = TranspositionTable::DEFAULT_MAX_ENTRIES;
        uint32_t seed = std::random_device{}();

        Config() {}
    };

    struct SearchStats {
        int nodesSearched = 0;
        int cacheHits = 0;
        const char* reason = "";  // which rule produced the last move
    };

    explicit Minimax(const Config& config = Config());

    // Best move for `aiMark` on a classic board, or NO_MOVE when full.
    int bestMove(const Board& board, Board::Mark aiMark, Difficulty difficulty = Difficulty::HARD);

    // Full-width minimax value of the position with `aiMark` to maximise.
    // Used by tests and by bestMove after the short-circuits.
    int evaluate(Board& board, int depth, bool maximizing, Board::Mark aiMark,
                 int alpha = -SCORE_BOUND, int beta = SCORE_BOUND);

    // Optional prediction source for the adaptive counter step. Not owned.
    void setOpponentModel(const OpponentModel* model) { opponentModel_ = model; }

    void clearCache() { cache_.clear(); }
    const TranspositionTable& getCache() const { return cache_; }
    const SearchStats& getLastStats() const { return stats_; }
    const Config& getConfig() const { return config_; }

private:
    Config config_;
    TranspositionTable cache_;
    const OpponentModel* opponentModel_ = nullptr;
    std::mt19937 rng_;
    SearchStats stats_;

    int searchFullTree(Board& board, Board::Mark aiMark, int* bestScoreOut);
    bool rollCounter(Difficulty difficulty);

    static uint64_t cacheKey(const Board& board, bool maximizing, int depth, Board::Mark aiMark);
};

#endif // MINIMAX_HPP

#ifndef LIMITEDSEARCH_HPP
#define LIMITEDSEARCH_HPP

#include "Board.hpp"

// ============================================================================
// LimitedSearch - shallow heuristic lookahead for the limited variant
// ============================================================================
// Placing a fourth piece evicts the mover's oldest one, so the board never
// fills up. The search therefore stops after a fixed number of plies and
// scores the leaf with BoardEvaluator::evaluateLimitedPosition.

class LimitedSearch {
public:
    // Dominates any heuristic score
    static constexpr int WIN_SCORE = 1000;

    struct Config {
        int lookaheadPlies = 2;  // opponent reply, then AI reply

        Config() {}
    };

    explicit LimitedSearch(const Config& config = Config());

    int bestMove(const Board& board, Board::Mark aiMark,
                 const PieceHistory& aiHistory, const PieceHistory& oppHistory);

    // Score of `aiMark` playing `cell` (evicting if needed) followed by the
    // configured lookahead.
    int scoreMove(const Board& board, int cell, Board::Mark aiMark,
                  const PieceHistory& aiHistory, const PieceHistory& oppHistory);

    int getLastEvaluations() const { return evaluations_; }
    const Config& getConfig() const { return config_; }

private:
    Config config_;
    int evaluations_ = 0;

    int lookahead(Board& board, Board::Mark aiMark, PieceHistory& aiHistory,
                  PieceHistory& oppHistory, int plies, bool maximizing);
    int bestScoredMove(const Board& board, Board::Mark aiMark,
                       const PieceHistory& aiHistory, const PieceHistory& oppHistory);
};

#endif // LIMITEDSEARCH_HPP

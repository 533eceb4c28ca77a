#ifndef OPPONENTMODEL_HPP
#define OPPONENTMODEL_HPP

#include "Board.hpp"
#include "LoadResult.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// OpponentModel - P(move | board) learned from observed opponent moves
// ============================================================================
// Boards are stored under their canonical (symmetry-reduced) serialization
// and moves in the canonical orientation, so equivalent positions share one
// distribution.

class OpponentModel {
public:
    static constexpr double LEARNING_RATE = 0.2;
    static constexpr int MIN_OBSERVATIONS = 2;
    static constexpr double HIGH_CONFIDENCE = 0.6;
    static constexpr double MIN_CONFIDENCE = 0.3;

    // Prior over cells: centre 0.4, corners 0.15, sides 0.05
    static constexpr double PRIOR[Board::CELLS] = {
        0.15, 0.05, 0.15,
        0.05, 0.40, 0.05,
        0.15, 0.05, 0.15
    };

    struct Prediction {
        int move;
        double confidence;
    };

    struct MoveProbability {
        int move;
        double probability;
    };

    struct PatternDetail {
        std::string boardState;
        int observations = 0;
        std::vector<MoveProbability> probabilities;
    };

    struct BayesianStats {
        int totalPatterns = 0;
        std::vector<PatternDetail> patternDetails;
    };

    OpponentModel() = default;

    // Records that the opponent played `move` on `board`. The board may be
    // given before or after the move; the move cell is cleared first.
    // Returns false when `move` is not a cell index.
    bool observe(const Board& board, int move);

    std::optional<Prediction> predict(const Board& board) const;

    // Cell to occupy before the opponent does, when the prediction is
    // confident enough.
    std::optional<int> counterMove(const Board& board) const;

    void reset() { table_.clear(); }

    // Patterns by observations (most first), moves by probability.
    BayesianStats getStats() const;

    // Replaces the learned state. Invalid patterns are skipped.
    LoadResult load(const BayesianStats& stats);

    int patternCount() const { return static_cast<int>(table_.size()); }
    int observationsFor(const Board& board) const;

private:
    struct ConditionalProbability {
        std::map<int, double> moveProbabilities;  // canonical cell -> mass
        int totalObservations = 0;
    };

    std::map<std::string, ConditionalProbability> table_;

    static void normalize(ConditionalProbability& entry);
};

#endif // OPPONENTMODEL_HPP

#include "OpponentModel.hpp"
#include "Symmetry.hpp"
#include <algorithm>
#include <cmath>

void OpponentModel::normalize(ConditionalProbability& entry) {
    double sum = 0.0;
    for (const auto& [move, prob] : entry.moveProbabilities) {
        sum += prob;
    }
    if (sum <= 0.0) {
        return;
    }
    for (auto& [move, prob] : entry.moveProbabilities) {
        prob /= sum;
    }
}

bool OpponentModel::observe(const Board& board, int move) {
    if (!Board::isValidIndex(move)) {
        return false;
    }

    Board before = board;
    before.clear(move);

    Symmetry::Canonical canonical = Symmetry::canonicalize(before);
    int canonicalMove = Symmetry::toCanonical(move, canonical.transform);

    auto it = table_.find(canonical.key);
    if (it == table_.end()) {
        ConditionalProbability entry;
        for (int i = 0; i < Board::CELLS; i++) {
            if (canonical.key[i] == '-') {
                entry.moveProbabilities[i] = PRIOR[i];
            }
        }
        it = table_.emplace(canonical.key, std::move(entry)).first;
    }

    ConditionalProbability& entry = it->second;
    double& prob = entry.moveProbabilities[canonicalMove];
    prob = prob * (1.0 - LEARNING_RATE) + LEARNING_RATE;
    normalize(entry);
    entry.totalObservations++;
    return true;
}

std::optional<OpponentModel::Prediction> OpponentModel::predict(const Board& board) const {
    Symmetry::Canonical canonical = Symmetry::canonicalize(board);
    auto it = table_.find(canonical.key);
    if (it == table_.end() || it->second.totalObservations < MIN_OBSERVATIONS) {
        return std::nullopt;
    }

    int bestMove = Board::NO_MOVE;
    double highest = 0.0;
    for (const auto& [move, prob] : it->second.moveProbabilities) {
        int actual = Symmetry::fromCanonical(move, canonical.transform);
        if (board.isEmpty(actual) && prob > highest) {
            highest = prob;
            bestMove = actual;
        }
    }

    if (bestMove == Board::NO_MOVE) {
        return std::nullopt;
    }
    return Prediction{bestMove, highest};
}

std::optional<int> OpponentModel::counterMove(const Board& board) const {
    auto prediction = predict(board);
    if (!prediction) {
        return std::nullopt;
    }
    if (prediction->confidence > HIGH_CONFIDENCE) {
        return prediction->move;
    }
    // Moderate confidence still preempts the cell
    if (prediction->confidence > MIN_CONFIDENCE) {
        return prediction->move;
    }
    return std::nullopt;
}

int OpponentModel::observationsFor(const Board& board) const {
    auto it = table_.find(Symmetry::canonicalize(board).key);
    return it == table_.end() ? 0 : it->second.totalObservations;
}

OpponentModel::BayesianStats OpponentModel::getStats() const {
    BayesianStats stats;
    stats.totalPatterns = static_cast<int>(table_.size());
    stats.patternDetails.reserve(table_.size());

    for (const auto& [key, entry] : table_) {
        PatternDetail detail;
        detail.boardState = key;
        detail.observations = entry.totalObservations;
        for (const auto& [move, prob] : entry.moveProbabilities) {
            detail.probabilities.push_back({move, prob});
        }
        std::stable_sort(detail.probabilities.begin(), detail.probabilities.end(),
            [](const MoveProbability& a, const MoveProbability& b) {
                return a.probability > b.probability;
            });
        stats.patternDetails.push_back(std::move(detail));
    }

    std::stable_sort(stats.patternDetails.begin(), stats.patternDetails.end(),
        [](const PatternDetail& a, const PatternDetail& b) {
            return a.observations > b.observations;
        });
    return stats;
}

LoadResult OpponentModel::load(const BayesianStats& stats) {
    std::map<std::string, ConditionalProbability> loaded;
    int skipped = 0;
    std::string diagnostic;

    for (const auto& detail : stats.patternDetails) {
        Board board;
        if (!Board::parse(detail.boardState, board)) {
            skipped++;
            diagnostic = "bad board state '" + detail.boardState + "'";
            continue;
        }

        // Stored keys are re-canonicalized so hand-edited or older blobs
        // still line up with lookups.
        Symmetry::Canonical canonical = Symmetry::canonicalize(board);

        ConditionalProbability entry;
        entry.totalObservations = std::max(1, detail.observations);
        bool valid = !detail.probabilities.empty();
        for (const auto& mp : detail.probabilities) {
            if (!Board::isValidIndex(mp.move) || !board.isEmpty(mp.move) ||
                !std::isfinite(mp.probability) || mp.probability < 0.0) {
                valid = false;
                break;
            }
            entry.moveProbabilities[Symmetry::toCanonical(mp.move, canonical.transform)] = mp.probability;
        }
        double sum = 0.0;
        for (const auto& [move, prob] : entry.moveProbabilities) {
            sum += prob;
        }
        if (!valid || sum <= 0.0) {
            skipped++;
            diagnostic = "bad probabilities for '" + detail.boardState + "'";
            continue;
        }

        normalize(entry);
        loaded[canonical.key] = std::move(entry);
    }
    if (loaded.empty() && skipped > 0) {
        return LoadResult::fromCounts(0, skipped, diagnostic);
    }

    table_ = std::move(loaded);
    return LoadResult::fromCounts(static_cast<int>(table_.size()), skipped, diagnostic);
}

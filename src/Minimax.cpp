#include "Minimax.hpp"
#include "BoardEvaluator.hpp"
#include "OpponentModel.hpp"
#include "Profiler.hpp"
#include <algorithm>

Minimax::Minimax(const Config& config)
    : config_(config)
    , cache_(config.maxCacheEntries)
    , rng_(config.seed) {
}

uint64_t Minimax::cacheKey(const Board& board, bool maximizing, int depth, Board::Mark aiMark) {
    uint64_t code = 0;
    for (int i = 0; i < Board::CELLS; i++) {
        code = code * 3 + board.get(i);
    }
    uint64_t key = (code * 2 + (maximizing ? 1 : 0)) * 16 + static_cast<uint64_t>(depth);
    return key * 2 + (aiMark == Board::X ? 0 : 1);
}

bool Minimax::rollCounter(Difficulty difficulty) {
    double rate = 0.0;
    if (difficulty == Difficulty::HARD) {
        rate = config_.hardCounterRate;
    } else if (difficulty == Difficulty::MEDIUM) {
        rate = config_.mediumCounterRate;
    }
    if (rate <= 0.0) {
        return false;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_) < rate;
}

int Minimax::bestMove(const Board& board, Board::Mark aiMark, Difficulty difficulty) {
    PROFILE_SCOPE("Minimax::bestMove");
    stats_ = SearchStats();

    std::vector<int> empty = board.getEmptyCells();
    if (empty.empty()) {
        stats_.reason = "none";
        return Board::NO_MOVE;
    }
    if (empty.size() == 1) {
        stats_.reason = "forced";
        return empty[0];
    }

    Board::Mark opp = Board::opponent(aiMark);

    int move = BoardEvaluator::winningMove(board, aiMark);
    if (move != Board::NO_MOVE) {
        stats_.reason = "win";
        return move;
    }

    move = BoardEvaluator::winningMove(board, opp);
    if (move != Board::NO_MOVE) {
        stats_.reason = "block";
        return move;
    }

    if (opponentModel_) {
        auto counter = opponentModel_->counterMove(board);
        if (counter && board.isLegalMove(*counter) && rollCounter(difficulty)) {
            stats_.reason = "counter";
            return *counter;
        }
    }

    move = BoardEvaluator::forkMove(board, aiMark);
    if (move != Board::NO_MOVE) {
        stats_.reason = "fork";
        return move;
    }

    move = BoardEvaluator::forkMove(board, opp);
    if (move != Board::NO_MOVE) {
        // With two fork cells available to the opponent the first one can be
        // the wrong block, so it has to score as well as the searched move.
        Board scratch = board;
        int bestScore = 0;
        int searched = searchFullTree(scratch, aiMark, &bestScore);
        scratch.set(move, aiMark);
        int blockScore = evaluate(scratch, 0, false, aiMark);
        stats_.reason = blockScore >= bestScore ? "block fork" : "search";
        return blockScore >= bestScore ? move : searched;
    }

    if (board.isEmpty(Board::CENTER)) {
        stats_.reason = "center";
        return Board::CENTER;
    }

    Board scratch = board;
    stats_.reason = "search";
    return searchFullTree(scratch, aiMark, nullptr);
}

int Minimax::searchFullTree(Board& board, Board::Mark aiMark, int* bestScoreOut) {
    int bestMove = Board::NO_MOVE;
    int bestScore = -SCORE_BOUND;

    for (int i = 0; i < Board::CELLS; i++) {
        if (!board.isEmpty(i)) {
            continue;
        }
        board.set(i, aiMark);
        int score = evaluate(board, 0, false, aiMark);
        board.clear(i);

        // Strict comparison keeps the lowest index among equal scores
        if (bestMove == Board::NO_MOVE || score > bestScore) {
            bestScore = score;
            bestMove = i;
        }
    }
    if (bestScoreOut) {
        *bestScoreOut = bestScore;
    }
    return bestMove;
}

int Minimax::evaluate(Board& board, int depth, bool maximizing, Board::Mark aiMark,
                      int alpha, int beta) {
    stats_.nodesSearched++;
    const int alphaOrig = alpha;
    const int betaOrig = beta;
    const uint64_t key = cacheKey(board, maximizing, depth, aiMark);

    if (const auto* entry = cache_.probe(key)) {
        if (entry->type == TranspositionTable::EXACT) {
            stats_.cacheHits++;
            return entry->value;
        }
        if (entry->type == TranspositionTable::LOWER_BOUND && entry->value >= beta) {
            stats_.cacheHits++;
            return entry->value;
        }
        if (entry->type == TranspositionTable::UPPER_BOUND && entry->value <= alpha) {
            stats_.cacheHits++;
            return entry->value;
        }
    }

    Board::Mark winner = board.getWinner();
    if (winner != Board::EMPTY) {
        int score = winner == aiMark ? WIN_SCORE - depth : depth - WIN_SCORE;
        cache_.store(key, score, TranspositionTable::EXACT);
        return score;
    }
    if (board.isFull()) {
        cache_.store(key, 0, TranspositionTable::EXACT);
        return 0;
    }

    int best;
    if (maximizing) {
        best = -SCORE_BOUND;
        for (int i = 0; i < Board::CELLS; i++) {
            if (!board.isEmpty(i)) {
                continue;
            }
            board.set(i, aiMark);
            int score = evaluate(board, depth + 1, false, aiMark, alpha, beta);
            board.clear(i);
            best = std::max(best, score);
            alpha = std::max(alpha, best);
            if (beta <= alpha) {
                break;
            }
        }
    } else {
        Board::Mark opp = Board::opponent(aiMark);
        best = SCORE_BOUND;
        for (int i = 0; i < Board::CELLS; i++) {
            if (!board.isEmpty(i)) {
                continue;
            }
            board.set(i, opp);
            int score = evaluate(board, depth + 1, true, aiMark, alpha, beta);
            board.clear(i);
            best = std::min(best, score);
            beta = std::min(beta, best);
            if (beta <= alpha) {
                break;
            }
        }
    }

    TranspositionTable::EntryType type = TranspositionTable::EXACT;
    if (best <= alphaOrig) {
        type = TranspositionTable::UPPER_BOUND;
    } else if (best >= betaOrig) {
        type = TranspositionTable::LOWER_BOUND;
    }
    cache_.store(key, best, type);
    return best;
}

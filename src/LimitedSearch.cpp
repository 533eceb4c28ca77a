#include "LimitedSearch.hpp"
#include "BoardEvaluator.hpp"
#include "Profiler.hpp"
#include <algorithm>

LimitedSearch::LimitedSearch(const Config& config)
    : config_(config) {
}

int LimitedSearch::bestMove(const Board& board, Board::Mark aiMark,
                            const PieceHistory& aiHistory, const PieceHistory& oppHistory) {
    PROFILE_SCOPE("LimitedSearch::bestMove");
    evaluations_ = 0;

    if (board.countEmpty() == 0) {
        return Board::NO_MOVE;
    }

    int move = BoardEvaluator::tacticalMove(board, aiMark, &aiHistory, &oppHistory);
    if (move != Board::NO_MOVE) {
        return move;
    }

    // Every placement now also gives up the oldest piece
    if (aiHistory.isFull()) {
        return bestScoredMove(board, aiMark, aiHistory, oppHistory);
    }

    if (board.isEmpty(Board::CENTER)) {
        return Board::CENTER;
    }

    move = BoardEvaluator::forkMove(board, aiMark);
    if (move != Board::NO_MOVE) {
        return move;
    }

    move = BoardEvaluator::forkMove(board, Board::opponent(aiMark));
    if (move != Board::NO_MOVE) {
        return move;
    }

    return bestScoredMove(board, aiMark, aiHistory, oppHistory);
}

int LimitedSearch::bestScoredMove(const Board& board, Board::Mark aiMark,
                                  const PieceHistory& aiHistory, const PieceHistory& oppHistory) {
    int bestMove = Board::NO_MOVE;
    int bestScore = 0;

    for (int cell = 0; cell < Board::CELLS; cell++) {
        if (!board.isEmpty(cell)) {
            continue;
        }
        int score = scoreMove(board, cell, aiMark, aiHistory, oppHistory);
        if (bestMove == Board::NO_MOVE || score > bestScore) {
            bestScore = score;
            bestMove = cell;
        }
    }
    return bestMove;
}

int LimitedSearch::scoreMove(const Board& board, int cell, Board::Mark aiMark,
                             const PieceHistory& aiHistory, const PieceHistory& oppHistory) {
    Board sim = board;
    PieceHistory aiSim = aiHistory;
    PieceHistory oppSim = oppHistory;
    sim.placePiece(cell, aiMark, aiSim);
    return lookahead(sim, aiMark, aiSim, oppSim, config_.lookaheadPlies, false);
}

int LimitedSearch::lookahead(Board& board, Board::Mark aiMark, PieceHistory& aiHistory,
                             PieceHistory& oppHistory, int plies, bool maximizing) {
    Board::Mark opp = Board::opponent(aiMark);

    Board::Mark winner = board.getWinner();
    if (winner != Board::EMPTY) {
        return winner == aiMark ? WIN_SCORE : -WIN_SCORE;
    }
    if (plies <= 0 || board.countEmpty() == 0) {
        evaluations_++;
        return BoardEvaluator::evaluateLimitedPosition(board, aiMark, opp, aiHistory, oppHistory);
    }

    Board::Mark mover = maximizing ? aiMark : opp;
    PieceHistory& history = maximizing ? aiHistory : oppHistory;
    int best = maximizing ? -WIN_SCORE - 1 : WIN_SCORE + 1;

    for (int cell = 0; cell < Board::CELLS; cell++) {
        if (!board.isEmpty(cell)) {
            continue;
        }
        int evicted = board.placePiece(cell, mover, history);
        int score = lookahead(board, aiMark, aiHistory, oppHistory, plies - 1, !maximizing);
        board.undoPiece(cell, evicted, mover, history);

        best = maximizing ? std::max(best, score) : std::min(best, score);
    }
    return best;
}

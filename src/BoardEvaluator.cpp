#include "BoardEvaluator.hpp"
#include "Profiler.hpp"

int BoardEvaluator::winningMove(const Board& board, Board::Mark mark) {
    return winningMove(board, mark, Board::NO_MOVE);
}

int BoardEvaluator::winningMove(const Board& board, Board::Mark mark, int ignoredCell) {
    for (const auto& line : Board::LINES) {
        int owned = 0;
        int emptyCell = Board::NO_MOVE;
        int emptyCount = 0;
        for (int cell : line) {
            if (cell == ignoredCell) {
                continue;
            }
            Board::Mark m = board.get(cell);
            if (m == mark) {
                owned++;
            } else if (m == Board::EMPTY) {
                emptyCount++;
                if (emptyCell == Board::NO_MOVE) {
                    emptyCell = cell;
                }
            }
        }
        if (owned == 2 && emptyCount == 1) {
            return emptyCell;
        }
    }
    return Board::NO_MOVE;
}

int BoardEvaluator::countThreatsAfter(const Board& board, Board::Mark mark, int cell) {
    Board test = board;
    test.set(cell, mark);

    int threats = 0;
    for (const auto& line : Board::LINES) {
        int owned = 0;
        int empty = 0;
        for (int c : line) {
            Board::Mark m = test.get(c);
            if (m == mark) {
                owned++;
            } else if (m == Board::EMPTY) {
                empty++;
            }
        }
        if (owned == 2 && empty == 1) {
            threats++;
        }
    }
    return threats;
}

int BoardEvaluator::forkMove(const Board& board, Board::Mark mark) {
    for (int i = 0; i < Board::CELLS; i++) {
        if (board.isEmpty(i) && countThreatsAfter(board, mark, i) >= 2) {
            return i;
        }
    }
    return Board::NO_MOVE;
}

int BoardEvaluator::tacticalMove(const Board& board, Board::Mark mark,
                                 const PieceHistory* ownHistory,
                                 const PieceHistory* oppHistory) {
    int ownEvicted = (ownHistory && ownHistory->isFull()) ? ownHistory->oldest() : Board::NO_MOVE;
    int oppEvicted = (oppHistory && oppHistory->isFull()) ? oppHistory->oldest() : Board::NO_MOVE;

    int win = winningMove(board, mark, ownEvicted);
    if (win != Board::NO_MOVE) {
        return win;
    }
    return winningMove(board, Board::opponent(mark), oppEvicted);
}

int BoardEvaluator::controlScore(const Board& board, Board::Mark ai, Board::Mark opp) {
    int score = 0;

    for (const auto& line : Board::LINES) {
        int aiCount = 0;
        int oppCount = 0;
        int emptyCount = 0;
        for (int cell : line) {
            Board::Mark m = board.get(cell);
            if (m == ai) {
                aiCount++;
            } else if (m == opp) {
                oppCount++;
            } else {
                emptyCount++;
            }
        }

        if (aiCount > 0 && oppCount == 0) {
            score += LINE_SCORE * aiCount;
        }
        if (oppCount > 0 && aiCount == 0) {
            score -= LINE_SCORE * oppCount;
        }
        if (aiCount == 2 && emptyCount == 1) {
            score += NEAR_WIN_SCORE;
        }
        if (oppCount == 2 && emptyCount == 1) {
            score -= NEAR_WIN_SCORE;
        }
    }

    if (board.get(Board::CENTER) == ai) {
        score += CENTER_SCORE;
    } else if (board.get(Board::CENTER) == opp) {
        score -= CENTER_SCORE;
    }

    for (int corner : Board::CORNERS) {
        if (board.get(corner) == ai) {
            score += CORNER_SCORE;
        } else if (board.get(corner) == opp) {
            score -= CORNER_SCORE;
        }
    }

    return score;
}

// Control gained by `gaining` when `losing` loses the piece on `cell`
int BoardEvaluator::removalImpact(const Board& board, int cell, Board::Mark losing, Board::Mark gaining) {
    Board after = board;
    after.clear(cell);
    return controlScore(after, gaining, losing) - controlScore(board, gaining, losing);
}

int BoardEvaluator::evaluateLimitedPosition(const Board& board, Board::Mark ai, Board::Mark opp,
                                            const PieceHistory& aiHistory,
                                            const PieceHistory& oppHistory) {
    PROFILE_SCOPE("BoardEvaluator::evaluateLimitedPosition");
    int score = controlScore(board, ai, opp);

    if (aiHistory.isFull()) {
        score -= removalImpact(board, aiHistory.oldest(), ai, opp);
    }
    if (oppHistory.isFull()) {
        score += removalImpact(board, oppHistory.oldest(), opp, ai);
    }
    return score;
}

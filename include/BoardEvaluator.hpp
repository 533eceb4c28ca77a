#ifndef BOARDEVALUATOR_HPP
#define BOARDEVALUATOR_HPP

#include "Board.hpp"

// ============================================================================
// BoardEvaluator - stateless tactical checks and limited variant scoring
// ============================================================================
// All functions take the board by const reference and never mutate it.
// Cells are reported as indices 0-8, or Board::NO_MOVE.

class BoardEvaluator {
public:
    static constexpr int LINE_SCORE = 10;
    static constexpr int NEAR_WIN_SCORE = 30;
    static constexpr int CENTER_SCORE = 15;
    static constexpr int CORNER_SCORE = 5;

    // First line (rows, columns, diagonals) holding two of `mark` and one
    // empty cell. Returns that empty cell.
    static int winningMove(const Board& board, Board::Mark mark);

    // Same scan, ignoring the piece on `ignoredCell` (it is about to be
    // evicted). The ignored cell is not a candidate either.
    static int winningMove(const Board& board, Board::Mark mark, int ignoredCell);

    // First empty cell (index order) that would give `mark` two or more
    // open two-in-a-lines.
    static int forkMove(const Board& board, Board::Mark mark);

    // Immediate win, else immediate block. With histories (limited variant)
    // the mover's oldest piece is discounted before looking for a win and an
    // opponent line resting on the opponent's oldest piece is not a threat.
    static int tacticalMove(const Board& board, Board::Mark mark,
                            const PieceHistory* ownHistory = nullptr,
                            const PieceHistory* oppHistory = nullptr);

    // Line control: exclusive lines, near wins, centre and corners.
    static int controlScore(const Board& board, Board::Mark ai, Board::Mark opp);

    // controlScore plus the swing caused by each side's pending eviction.
    static int evaluateLimitedPosition(const Board& board, Board::Mark ai, Board::Mark opp,
                                       const PieceHistory& aiHistory,
                                       const PieceHistory& oppHistory);

    // Number of lines that would be two-of-`mark` plus one empty after
    // `mark` plays `cell`.
    static int countThreatsAfter(const Board& board, Board::Mark mark, int cell);

private:
    static int removalImpact(const Board& board, int cell, Board::Mark losing, Board::Mark gaining);
};

#endif // BOARDEVALUATOR_HPP

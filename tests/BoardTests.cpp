#include <gtest/gtest.h>
#include "Board.hpp"
#include <stdexcept>

class BoardTest : public ::testing::Test {
protected:
    Board board;
};

TEST_F(BoardTest, StartsEmpty) {
    EXPECT_EQ(board.countEmpty(), Board::CELLS);
    EXPECT_EQ(board.getWinner(), Board::EMPTY);
    EXPECT_EQ(board.serialize(), "---------");
    EXPECT_FALSE(board.isFull());
}

TEST_F(BoardTest, DetectsEveryLine) {
    for (int line = 0; line < Board::NUM_LINES; line++) {
        Board b;
        for (int cell : Board::LINES[line]) {
            b.set(cell, Board::O);
        }
        EXPECT_EQ(b.getWinner(), Board::O) << "line " << line;
        EXPECT_EQ(b.getWinningLine(), line);
    }
}

TEST_F(BoardTest, MixedLineIsNotAWin) {
    board = Board::fromString("XXO------");
    EXPECT_EQ(board.getWinner(), Board::EMPTY);
    EXPECT_EQ(board.getWinningLine(), -1);
}

TEST_F(BoardTest, ParseAcceptsLowercaseAndDots) {
    Board parsed;
    ASSERT_TRUE(Board::parse("x.o......", parsed));
    EXPECT_EQ(parsed.get(0), Board::X);
    EXPECT_EQ(parsed.get(1), Board::EMPTY);
    EXPECT_EQ(parsed.get(2), Board::O);
    EXPECT_EQ(parsed.serialize(), "X-O------");
}

TEST_F(BoardTest, ParseRejectsBadInput) {
    Board parsed = Board::fromString("X--------");
    EXPECT_FALSE(Board::parse("XO", parsed));
    EXPECT_FALSE(Board::parse("XOZ------", parsed));
    // Failed parse leaves the target untouched
    EXPECT_EQ(parsed.serialize(), "X--------");
    EXPECT_THROW(Board::fromString("not a board"), std::invalid_argument);
}

TEST_F(BoardTest, LegalMoveChecksBoundsAndOccupancy) {
    board.set(4, Board::X);
    EXPECT_FALSE(board.isLegalMove(4));
    EXPECT_FALSE(board.isLegalMove(-1));
    EXPECT_FALSE(board.isLegalMove(9));
    EXPECT_TRUE(board.isLegalMove(0));
}

TEST_F(BoardTest, EmptyCellsInIndexOrder) {
    board = Board::fromString("X-O-X-O--");
    std::vector<int> expected = {1, 3, 5, 7, 8};
    EXPECT_EQ(board.getEmptyCells(), expected);
    EXPECT_EQ(board.countMarks(Board::X), 2);
    EXPECT_EQ(board.countMarks(Board::O), 2);
}

// ============================================================================
// PieceHistory / eviction
// ============================================================================

class PieceHistoryTest : public ::testing::Test {
protected:
    Board board;
    PieceHistory history;

    void placeAll(std::initializer_list<int> moves) {
        for (int move : moves) {
            board.placePiece(move, Board::X, history);
        }
    }
};

TEST_F(PieceHistoryTest, FourthPieceEvictsOldest) {
    placeAll({0, 3, 6});
    ASSERT_TRUE(history.isFull());

    int evicted = board.placePiece(1, Board::X, history);

    EXPECT_EQ(evicted, 0);
    EXPECT_EQ(history.moves(), (std::vector<int>{3, 6, 1}));
    EXPECT_TRUE(board.isEmpty(0));
    EXPECT_EQ(board.get(1), Board::X);
    EXPECT_EQ(board.countMarks(Board::X), PieceHistory::MAX_PIECES);
}

TEST_F(PieceHistoryTest, NeverHoldsMoreThanThree) {
    placeAll({0, 1, 2, 3, 4, 5, 6, 7, 8});
    EXPECT_EQ(history.size(), PieceHistory::MAX_PIECES);
    EXPECT_EQ(board.countMarks(Board::X), PieceHistory::MAX_PIECES);
    for (int cell : history.moves()) {
        EXPECT_EQ(board.get(cell), Board::X);
    }
}

TEST_F(PieceHistoryTest, UndoRestoresEvictedPiece) {
    placeAll({0, 3, 6});
    Board before = board;
    PieceHistory historyBefore = history;

    int evicted = board.placePiece(1, Board::X, history);
    board.undoPiece(1, evicted, Board::X, history);

    EXPECT_EQ(board, before);
    EXPECT_EQ(history, historyBefore);
}

TEST_F(PieceHistoryTest, NoEvictionBelowCapacity) {
    EXPECT_EQ(board.placePiece(4, Board::X, history), Board::NO_MOVE);
    EXPECT_EQ(history.oldest(), 4);
    EXPECT_FALSE(history.isFull());
    EXPECT_TRUE(history.contains(4));
    EXPECT_FALSE(history.contains(0));
}

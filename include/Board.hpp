#ifndef BOARD_HPP
#define BOARD_HPP

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

class PieceHistory;

enum class Variant : uint8_t {
    CLASSIC = 0,  // unbounded pieces
    LIMITED = 1   // 3 live pieces per player, oldest evicted
};

enum class Difficulty : uint8_t {
    EASY = 0,
    MEDIUM = 1,
    HARD = 2
};

// ============================================================================
// Board - 3x3 grid, value type
// ============================================================================

class Board {
public:
    static constexpr int CELLS = 9;
    static constexpr int NUM_LINES = 8;
    static constexpr int CENTER = 4;
    static constexpr int NO_MOVE = -1;

    enum Mark : uint8_t {
        EMPTY = 0,
        X = 1,
        O = 2
    };

    // Canonical scan order: rows, columns, diagonals
    static constexpr int LINES[NUM_LINES][3] = {
        {0, 1, 2}, {3, 4, 5}, {6, 7, 8},
        {0, 3, 6}, {1, 4, 7}, {2, 5, 8},
        {0, 4, 8}, {2, 4, 6}
    };
    static constexpr int CORNERS[4] = {0, 2, 6, 8};
    static constexpr int SIDES[4] = {1, 3, 5, 7};

    Board();

    // Cell access
    Mark get(int index) const { return cells_[index]; }
    void set(int index, Mark mark) { cells_[index] = mark; }
    void clear(int index) { cells_[index] = EMPTY; }
    bool isEmpty(int index) const { return cells_[index] == EMPTY; }
    static bool isValidIndex(int index) { return index >= 0 && index < CELLS; }
    bool isLegalMove(int index) const { return isValidIndex(index) && isEmpty(index); }

    // Limited variant placement: evicts the mover's oldest piece when the
    // history is full. Returns the evicted cell or NO_MOVE.
    int placePiece(int index, Mark mark, PieceHistory& history);
    void undoPiece(int index, int evicted, Mark mark, PieceHistory& history);

    // Queries
    std::vector<int> getEmptyCells() const;
    int countEmpty() const;
    int countMarks(Mark mark) const;
    bool isFull() const { return countEmpty() == 0; }
    Mark getWinner() const;
    int getWinningLine() const;  // index into LINES, or -1

    // '-' for empty, e.g. "XO--X----"
    std::string serialize() const;
    static bool parse(const std::string& text, Board& out);
    static Board fromString(const std::string& text);

    static Mark opponent(Mark mark) { return mark == X ? O : X; }
    static char toChar(Mark mark);
    static bool fromChar(char c, Mark& out);

    bool operator==(const Board& other) const { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const { return cells_ != other.cells_; }

private:
    std::array<Mark, CELLS> cells_;
};

// ============================================================================
// PieceHistory - live pieces of one player, oldest first
// ============================================================================

class PieceHistory {
public:
    static constexpr int MAX_PIECES = 3;

    PieceHistory() = default;
    PieceHistory(std::initializer_list<int> moves);
    explicit PieceHistory(const std::vector<int>& moves);

    // Appends a move. Returns the evicted cell when already holding
    // MAX_PIECES, otherwise Board::NO_MOVE.
    int place(int move);
    void undo(int move, int evicted);

    int oldest() const { return moves_.empty() ? Board::NO_MOVE : moves_.front(); }
    bool isFull() const { return static_cast<int>(moves_.size()) >= MAX_PIECES; }
    int size() const { return static_cast<int>(moves_.size()); }
    bool empty() const { return moves_.empty(); }
    bool contains(int cell) const;
    const std::vector<int>& moves() const { return moves_; }
    void clear() { moves_.clear(); }

    bool operator==(const PieceHistory& other) const { return moves_ == other.moves_; }

private:
    std::vector<int> moves_;
};

#endif // BOARD_HPP

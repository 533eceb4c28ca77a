#include "Board.hpp"
#include <algorithm>
#include <stdexcept>

// ============================================================================
// Board
// ============================================================================

Board::Board() {
    cells_.fill(EMPTY);
}

int Board::placePiece(int index, Mark mark, PieceHistory& history) {
    int evicted = history.place(index);
    if (evicted != NO_MOVE) {
        cells_[evicted] = EMPTY;
    }
    cells_[index] = mark;
    return evicted;
}

void Board::undoPiece(int index, int evicted, Mark mark, PieceHistory& history) {
    cells_[index] = EMPTY;
    if (evicted != NO_MOVE) {
        cells_[evicted] = mark;
    }
    history.undo(index, evicted);
}

std::vector<int> Board::getEmptyCells() const {
    std::vector<int> moves;
    moves.reserve(CELLS);
    for (int i = 0; i < CELLS; i++) {
        if (cells_[i] == EMPTY) {
            moves.push_back(i);
        }
    }
    return moves;
}

int Board::countEmpty() const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), EMPTY));
}

int Board::countMarks(Mark mark) const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), mark));
}

Board::Mark Board::getWinner() const {
    int line = getWinningLine();
    return line < 0 ? EMPTY : cells_[LINES[line][0]];
}

int Board::getWinningLine() const {
    for (int i = 0; i < NUM_LINES; i++) {
        Mark a = cells_[LINES[i][0]];
        if (a != EMPTY && a == cells_[LINES[i][1]] && a == cells_[LINES[i][2]]) {
            return i;
        }
    }
    return -1;
}

std::string Board::serialize() const {
    std::string out(CELLS, '-');
    for (int i = 0; i < CELLS; i++) {
        out[i] = toChar(cells_[i]);
    }
    return out;
}

bool Board::parse(const std::string& text, Board& out) {
    if (text.size() != static_cast<size_t>(CELLS)) {
        return false;
    }
    Board parsed;
    for (int i = 0; i < CELLS; i++) {
        Mark mark;
        if (!fromChar(text[i], mark)) {
            return false;
        }
        parsed.cells_[i] = mark;
    }
    out = parsed;
    return true;
}

Board Board::fromString(const std::string& text) {
    Board board;
    if (!parse(text, board)) {
        throw std::invalid_argument("Invalid board string: " + text);
    }
    return board;
}

char Board::toChar(Mark mark) {
    switch (mark) {
    case X:
        return 'X';
    case O:
        return 'O';
    default:
        return '-';
    }
}

bool Board::fromChar(char c, Mark& out) {
    switch (c) {
    case 'X':
    case 'x':
        out = X;
        return true;
    case 'O':
    case 'o':
        out = O;
        return true;
    case '-':
    case '.':
    case ' ':
        out = EMPTY;
        return true;
    default:
        return false;
    }
}

// ============================================================================
// PieceHistory
// ============================================================================

PieceHistory::PieceHistory(std::initializer_list<int> moves)
    : moves_(moves) {
}

PieceHistory::PieceHistory(const std::vector<int>& moves)
    : moves_(moves) {
}

int PieceHistory::place(int move) {
    int evicted = Board::NO_MOVE;
    if (isFull()) {
        evicted = moves_.front();
        moves_.erase(moves_.begin());
    }
    moves_.push_back(move);
    return evicted;
}

void PieceHistory::undo(int move, int evicted) {
    if (!moves_.empty() && moves_.back() == move) {
        moves_.pop_back();
    }
    if (evicted != Board::NO_MOVE) {
        moves_.insert(moves_.begin(), evicted);
    }
}

bool PieceHistory::contains(int cell) const {
    return std::find(moves_.begin(), moves_.end(), cell) != moves_.end();
}

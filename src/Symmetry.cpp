#include "Symmetry.hpp"

Board Symmetry::apply(const Board &board, int transform) {
    Board out;
    for (int i = 0; i < Board::CELLS; ++i) {
        out.set(i, board.get(PERMUTATIONS[transform][i]));
    }
    return out;
}

Symmetry::Canonical Symmetry::canonicalize(const Board &board) {
    Canonical best{board.serialize(), IDENTITY};
    for (int t = 1; t < NUM_TRANSFORMS; ++t) {
        std::string key = apply(board, t).serialize();
        // Strict: earlier transforms win ties
        if (key < best.key) {
            best.key = key;
            best.transform = t;
        }
    }
    return best;
}

const char *Symmetry::transformName(int transform) {
    switch (transform) {
    case 0:
        return "identity";
    case 1:
        return "rot90";
    case 2:
        return "rot180";
    case 3:
        return "rot270";
    case 4:
        return "flipH";
    case 5:
        return "flipV";
    case 6:
        return "diagonal";
    case 7:
        return "antiDiagonal";
    default:
        return "unknown";
    }
}

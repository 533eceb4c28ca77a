#ifndef SYMMETRY_HPP
#define SYMMETRY_HPP

#include "Board.hpp"
#include <string>

// The 8 dihedral transforms of the 3x3 grid as cell permutations.
// Applying transform t gives transformed[i] = original[PERMUTATIONS[t][i]].
class Symmetry {
  public:
    static constexpr int NUM_TRANSFORMS = 8;
    static constexpr int IDENTITY = 0;

    static constexpr int PERMUTATIONS[NUM_TRANSFORMS][Board::CELLS] = {
        {0, 1, 2, 3, 4, 5, 6, 7, 8}, // identity
        {6, 3, 0, 7, 4, 1, 8, 5, 2}, // rot90
        {8, 7, 6, 5, 4, 3, 2, 1, 0}, // rot180
        {2, 5, 8, 1, 4, 7, 0, 3, 6}, // rot270
        {2, 1, 0, 5, 4, 3, 8, 7, 6}, // mirror L<->R
        {6, 7, 8, 3, 4, 5, 0, 1, 2}, // mirror T<->B
        {0, 3, 6, 1, 4, 7, 2, 5, 8}, // main diagonal
        {8, 5, 2, 7, 4, 1, 6, 3, 0}  // anti diagonal
    };

    struct Canonical {
        std::string key;  // smallest serialization of the 8 forms
        int transform;    // first transform producing it
    };

    static Board apply(const Board &board, int transform);
    static Canonical canonicalize(const Board &board);

    // Cell index in the transformed grid holding the original `cell`.
    static int toCanonical(int cell, int transform) { return instance().inverse_[transform][cell]; }
    // Original cell shown at `cell` of the transformed grid.
    static int fromCanonical(int cell, int transform) { return PERMUTATIONS[transform][cell]; }

    static const char *transformName(int transform);

  private:
    int inverse_[NUM_TRANSFORMS][Board::CELLS];

    static const Symmetry &instance() {
        static const Symmetry s;
        return s;
    }

    Symmetry() {
        for (int t = 0; t < NUM_TRANSFORMS; ++t) {
            for (int i = 0; i < Board::CELLS; ++i) {
                inverse_[t][PERMUTATIONS[t][i]] = i;
            }
        }
    }
};

#endif // SYMMETRY_HPP

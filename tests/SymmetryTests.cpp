#include <gtest/gtest.h>
#include "Symmetry.hpp"
#include <set>

class SymmetryTest : public ::testing::Test {
protected:
    const Board sample = Board::fromString("XO--X---O");
};

TEST_F(SymmetryTest, CanonicalKeyIsSharedByAllEightForms) {
    std::string key = Symmetry::canonicalize(sample).key;
    for (int t = 0; t < Symmetry::NUM_TRANSFORMS; t++) {
        EXPECT_EQ(Symmetry::canonicalize(Symmetry::apply(sample, t)).key, key)
            << Symmetry::transformName(t);
    }
}

TEST_F(SymmetryTest, CanonicalizeIsIdempotent) {
    std::string key = Symmetry::canonicalize(sample).key;
    Symmetry::Canonical again = Symmetry::canonicalize(Board::fromString(key));
    EXPECT_EQ(again.key, key);
    EXPECT_EQ(again.transform, Symmetry::IDENTITY);
}

TEST_F(SymmetryTest, CanonicalKeyIsTheSmallestForm) {
    Symmetry::Canonical canonical = Symmetry::canonicalize(sample);
    EXPECT_EQ(Symmetry::apply(sample, canonical.transform).serialize(), canonical.key);
    for (int t = 0; t < Symmetry::NUM_TRANSFORMS; t++) {
        EXPECT_LE(canonical.key, Symmetry::apply(sample, t).serialize());
    }
}

TEST_F(SymmetryTest, SymmetricBoardKeepsIdentity) {
    // Every form of the empty board ties; the first transform wins
    EXPECT_EQ(Symmetry::canonicalize(Board()).transform, Symmetry::IDENTITY);
    EXPECT_EQ(Symmetry::canonicalize(Board::fromString("----X----")).transform, Symmetry::IDENTITY);
}

TEST_F(SymmetryTest, CellMappingFollowsThePiece) {
    for (int t = 0; t < Symmetry::NUM_TRANSFORMS; t++) {
        Board transformed = Symmetry::apply(sample, t);
        for (int cell = 0; cell < Board::CELLS; cell++) {
            int mapped = Symmetry::toCanonical(cell, t);
            EXPECT_EQ(transformed.get(mapped), sample.get(cell));
            EXPECT_EQ(Symmetry::fromCanonical(mapped, t), cell);
        }
    }
}

TEST_F(SymmetryTest, TransformsArePermutations) {
    for (int t = 0; t < Symmetry::NUM_TRANSFORMS; t++) {
        std::set<int> cells(std::begin(Symmetry::PERMUTATIONS[t]), std::end(Symmetry::PERMUTATIONS[t]));
        EXPECT_EQ(cells.size(), static_cast<size_t>(Board::CELLS));
        // The centre never moves
        EXPECT_EQ(Symmetry::PERMUTATIONS[t][Board::CENTER], Board::CENTER);
    }
}

TEST_F(SymmetryTest, CornerBoardsShareOneKey) {
    std::set<std::string> keys;
    for (int corner : Board::CORNERS) {
        Board b;
        b.set(corner, Board::X);
        keys.insert(Symmetry::canonicalize(b).key);
    }
    EXPECT_EQ(keys.size(), 1u);
    EXPECT_EQ(*keys.begin(), "--------X");
}

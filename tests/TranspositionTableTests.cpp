#include <gtest/gtest.h>
#include "TranspositionTable.hpp"

class TranspositionTableTest : public ::testing::Test {
protected:
    TranspositionTable table{4};
};

TEST_F(TranspositionTableTest, StoresAndProbes) {
    EXPECT_EQ(table.probe(7), nullptr);
    table.store(7, 5, TranspositionTable::LOWER_BOUND);

    const TranspositionTable::Entry* entry = table.probe(7);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->value, 5);
    EXPECT_EQ(entry->type, TranspositionTable::LOWER_BOUND);
}

TEST_F(TranspositionTableTest, OverwriteDoesNotGrow) {
    table.store(1, 1, TranspositionTable::EXACT);
    table.store(1, -3, TranspositionTable::UPPER_BOUND);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.probe(1)->value, -3);
}

TEST_F(TranspositionTableTest, ClearsWhenFull) {
    for (uint64_t key = 0; key < 4; key++) {
        table.store(key, 0, TranspositionTable::EXACT);
    }
    EXPECT_EQ(table.size(), table.capacity());
    EXPECT_EQ(table.clearCount(), 0u);

    // Updating a present key never triggers the clear
    table.store(2, 9, TranspositionTable::EXACT);
    EXPECT_EQ(table.size(), 4u);

    table.store(100, 1, TranspositionTable::EXACT);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.clearCount(), 1u);
    EXPECT_EQ(table.probe(0), nullptr);
    EXPECT_NE(table.probe(100), nullptr);
}

TEST_F(TranspositionTableTest, ZeroCapacityHoldsOneEntry) {
    TranspositionTable tiny(0);
    EXPECT_EQ(tiny.capacity(), 1u);
    tiny.store(1, 1, TranspositionTable::EXACT);
    tiny.store(2, 2, TranspositionTable::EXACT);
    EXPECT_EQ(tiny.size(), 1u);
}

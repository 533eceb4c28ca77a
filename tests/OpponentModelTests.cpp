#include <gtest/gtest.h>
#include "OpponentModel.hpp"

class OpponentModelTest : public ::testing::Test {
protected:
    OpponentModel model;

    static double totalProbability(const OpponentModel::PatternDetail& detail) {
        double sum = 0.0;
        for (const auto& mp : detail.probabilities) {
            sum += mp.probability;
        }
        return sum;
    }

    void observeTimes(const Board& board, int move, int times) {
        for (int i = 0; i < times; i++) {
            ASSERT_TRUE(model.observe(board, move));
        }
    }
};

TEST_F(OpponentModelTest, SingleObservationPredictsNothing) {
    Board centreO = Board::fromString("----O----");
    ASSERT_TRUE(model.observe(centreO, 0));
    EXPECT_FALSE(model.predict(centreO).has_value());
    EXPECT_FALSE(model.counterMove(centreO).has_value());
    EXPECT_EQ(model.observationsFor(centreO), 1);
}

TEST_F(OpponentModelTest, RejectsInvalidMove) {
    EXPECT_FALSE(model.observe(Board(), 9));
    EXPECT_FALSE(model.observe(Board(), -1));
    EXPECT_EQ(model.patternCount(), 0);
}

TEST_F(OpponentModelTest, ProbabilitiesStayNormalized) {
    observeTimes(Board(), 4, 3);
    observeTimes(Board::fromString("X--------"), 8, 1);
    observeTimes(Board::fromString("X---O----"), 2, 5);

    OpponentModel::BayesianStats stats = model.getStats();
    EXPECT_EQ(stats.totalPatterns, 3);
    for (const auto& detail : stats.patternDetails) {
        EXPECT_NEAR(totalProbability(detail), 1.0, 1e-9) << detail.boardState;
    }
    // Most observed first
    EXPECT_EQ(stats.patternDetails.front().observations, 5);
}

TEST_F(OpponentModelTest, RepeatedMoveBecomesPrediction) {
    Board b = Board::fromString("X--------");
    observeTimes(b, 8, 2);

    auto prediction = model.predict(b);
    ASSERT_TRUE(prediction.has_value());
    EXPECT_EQ(prediction->move, 8);
    EXPECT_GT(prediction->confidence, OpponentModel::MIN_CONFIDENCE);
    auto counter = model.counterMove(b);
    ASSERT_TRUE(counter.has_value());
    EXPECT_EQ(*counter, 8);
}

TEST_F(OpponentModelTest, PredictionFollowsSymmetry) {
    // X in corner 0 answered on 8 is the same pattern as X in 2 answered on 6
    observeTimes(Board::fromString("X--------"), 8, 2);

    auto prediction = model.predict(Board::fromString("--X------"));
    ASSERT_TRUE(prediction.has_value());
    EXPECT_EQ(prediction->move, 6);
    EXPECT_EQ(model.patternCount(), 1);
}

TEST_F(OpponentModelTest, BoardAfterMoveIsTheSamePattern) {
    Board before = Board::fromString("X--------");
    Board after = Board::fromString("X-------O");
    ASSERT_TRUE(model.observe(before, 8));
    ASSERT_TRUE(model.observe(after, 8));
    EXPECT_EQ(model.observationsFor(before), 2);
}

TEST_F(OpponentModelTest, LowConfidenceGivesNoCounter) {
    // Two side moves on an empty board still trail the centre prior
    observeTimes(Board(), 1, 2);

    auto prediction = model.predict(Board());
    ASSERT_TRUE(prediction.has_value());
    EXPECT_LT(prediction->confidence, OpponentModel::MIN_CONFIDENCE);
    EXPECT_FALSE(model.counterMove(Board()).has_value());
}

TEST_F(OpponentModelTest, ResetForgetsEverything) {
    observeTimes(Board(), 4, 2);
    model.reset();
    EXPECT_EQ(model.patternCount(), 0);
    EXPECT_FALSE(model.predict(Board()).has_value());
}

TEST_F(OpponentModelTest, LoadSkipsInvalidEntries) {
    OpponentModel::BayesianStats stats;

    OpponentModel::PatternDetail good;
    good.boardState = "X--------";
    good.observations = 4;
    good.probabilities = {{8, 3.0}, {4, 1.0}};
    stats.patternDetails.push_back(good);

    OpponentModel::PatternDetail badBoard;
    badBoard.boardState = "XYZ";
    badBoard.probabilities = {{0, 1.0}};
    stats.patternDetails.push_back(badBoard);

    OpponentModel::PatternDetail occupiedMove;
    occupiedMove.boardState = "----X----";
    occupiedMove.probabilities = {{4, 1.0}};
    stats.patternDetails.push_back(occupiedMove);

    OpponentModel::PatternDetail negative;
    negative.boardState = "-X-------";
    negative.probabilities = {{0, -0.5}};
    stats.patternDetails.push_back(negative);

    LoadResult result = model.load(stats);
    EXPECT_EQ(result.status, LoadResult::PARTIAL);
    EXPECT_EQ(result.loadedEntries, 1);
    EXPECT_EQ(result.skippedEntries, 3);

    auto prediction = model.predict(Board::fromString("X--------"));
    ASSERT_TRUE(prediction.has_value());
    EXPECT_EQ(prediction->move, 8);
    EXPECT_NEAR(prediction->confidence, 0.75, 1e-9);
}

TEST_F(OpponentModelTest, LoadRecanonicalizesKeys) {
    OpponentModel::BayesianStats stats;
    OpponentModel::PatternDetail detail;
    detail.boardState = "X--------";   // not the canonical orientation
    detail.observations = 2;
    detail.probabilities = {{8, 1.0}};
    stats.patternDetails.push_back(detail);

    ASSERT_EQ(model.load(stats).status, LoadResult::LOADED);
    EXPECT_EQ(model.getStats().patternDetails.front().boardState, "--------X");

    auto prediction = model.predict(Board::fromString("--X------"));
    ASSERT_TRUE(prediction.has_value());
    EXPECT_EQ(prediction->move, 6);
}

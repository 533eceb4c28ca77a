#include <gtest/gtest.h>
#include "AdaptiveEngine.hpp"
#include "TicTacToeGame.hpp"
#include <memory>

class AdaptiveEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<AdaptiveEngine> engine;

    void SetUp() override {
        AdaptiveEngine::Config config = AdaptiveEngine::Config::seeded(42);
        config.mcts.maxIterations = 300;
        engine = std::make_unique<AdaptiveEngine>(config);
    }

    int move(const Board& board, Board::Mark aiMark, Difficulty difficulty) {
        return engine->computeMove(board, aiMark, Variant::CLASSIC, PieceHistory(), PieceHistory(), difficulty);
    }
};

TEST_F(AdaptiveEngineTest, DefaultConfigsConstruct) {
    TicTacToeGame game;
    EXPECT_EQ(game.getConfig().variant, Variant::CLASSIC);
    EXPECT_EQ(game.getConfig().firstPlayer, Board::X);

    Minimax minimax;
    EXPECT_DOUBLE_EQ(minimax.getConfig().hardCounterRate, 0.9);
    LimitedSearch limitedSearch;
    EXPECT_EQ(limitedSearch.getConfig().lookaheadPlies, 2);

    AdaptiveEngine defaults;
    EXPECT_DOUBLE_EQ(defaults.getConfig().easyWinChance, 0.8);
    EXPECT_EQ(defaults.getConfig().mediumMctsIterations, 200);
    Board b = Board::fromString("X---O----");
    EXPECT_TRUE(b.isLegalMove(defaults.computeMove(b, Board::X, Variant::CLASSIC, PieceHistory(),
                                                   PieceHistory(), Difficulty::EASY)));
}

TEST_F(AdaptiveEngineTest, FullBoardHasNoMove) {
    Board full = Board::fromString("XOXXOOOXX");
    for (Difficulty difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
        EXPECT_EQ(move(full, Board::X, difficulty), Board::NO_MOVE);
        EXPECT_EQ(engine->getLastSource(), "none");
    }
}

TEST_F(AdaptiveEngineTest, EveryDifficultyPlaysLegally) {
    Board b = Board::fromString("X---O----");
    for (int i = 0; i < 20; i++) {
        for (Difficulty difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
            int m = move(b, Board::X, difficulty);
            EXPECT_TRUE(b.isLegalMove(m)) << "played " << m;
        }
    }
}

TEST_F(AdaptiveEngineTest, HardTakesWinAndBlocks) {
    EXPECT_EQ(move(Board::fromString("XX-OO----"), Board::X, Difficulty::HARD), 2);
    EXPECT_EQ(move(Board::fromString("XX--O----"), Board::O, Difficulty::HARD), 2);
}

TEST_F(AdaptiveEngineTest, HardReportsChosenStrategy) {
    move(Board(), Board::X, Difficulty::HARD);
    auto current = engine->getSelector().getCurrentStrategy();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(engine->getLastSource(), strategyName(*current));
}

TEST_F(AdaptiveEngineTest, EasyWithCertainRollsTakesWin) {
    AdaptiveEngine::Config config = AdaptiveEngine::Config::seeded(7);
    config.easyWinChance = 1.0;
    config.easyBlockChance = 1.0;
    AdaptiveEngine sure(config);

    Board winning = Board::fromString("XX-OO----");
    EXPECT_EQ(sure.computeMove(winning, Board::X, Variant::CLASSIC, PieceHistory(), PieceHistory(),
                               Difficulty::EASY), 2);
    EXPECT_EQ(sure.getLastSource(), "easy");

    Board threatened = Board::fromString("XX--O----");
    EXPECT_EQ(sure.computeMove(threatened, Board::O, Variant::CLASSIC, PieceHistory(), PieceHistory(),
                               Difficulty::EASY), 2);
}

TEST_F(AdaptiveEngineTest, EasyWinCountsEviction) {
    AdaptiveEngine::Config config = AdaptiveEngine::Config::seeded(7);
    config.easyWinChance = 1.0;
    AdaptiveEngine sure(config);

    // Playing 2 evicts the X on 0; only the middle column completes
    Board b = Board::fromString("XX-O---XO");
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(sure.computeMove(b, Board::X, Variant::LIMITED, PieceHistory{0, 1, 7}, PieceHistory{3, 8},
                                   Difficulty::EASY), 4);
    }
}

TEST_F(AdaptiveEngineTest, MediumFallsBackToShortMCTS) {
    AdaptiveEngine::Config config = AdaptiveEngine::Config::seeded(9);
    config.mediumAdaptiveChance = 0.0;
    AdaptiveEngine lite(config);

    Board b = Board::fromString("X---O----");
    int m = lite.computeMove(b, Board::X, Variant::CLASSIC, PieceHistory(), PieceHistory(), Difficulty::MEDIUM);
    EXPECT_TRUE(b.isLegalMove(m));
    EXPECT_EQ(lite.getLastSource(), "mcts-lite");
    EXPECT_EQ(lite.getMCTS().getLastSearchInfo().iterations, config.mediumMctsIterations);
}

TEST_F(AdaptiveEngineTest, GameOverloadUsesPlayerToMove) {
    TicTacToeGame game;
    ASSERT_TRUE(game.makeMove(0));
    ASSERT_TRUE(game.makeMove(3));
    ASSERT_TRUE(game.makeMove(1));
    // O to move must block the top row
    EXPECT_EQ(engine->computeMove(game, Difficulty::HARD), 2);
}

TEST_F(AdaptiveEngineTest, ObservationAndOutcomeUpdateStats) {
    ASSERT_TRUE(engine->observePlayerMove(Board(), 4));
    EXPECT_FALSE(engine->observePlayerMove(Board(), 12));
    EXPECT_EQ(engine->getBayesianStats().totalPatterns, 1);

    move(Board::fromString("----X----"), Board::O, Difficulty::HARD);
    auto current = engine->getSelector().getCurrentStrategy();
    ASSERT_TRUE(current.has_value());
    engine->recordGameOutcome(Board::X, Board::O);

    const StrategySelector::StrategyStats& arm = engine->getSelector().getArm(*current);
    EXPECT_EQ(arm.losses, 2);
    EXPECT_EQ(arm.total, 4);
}

TEST_F(AdaptiveEngineTest, LearningRoundTripsThroughEngine) {
    ASSERT_TRUE(engine->observePlayerMove(Board::fromString("X--------"), 8));
    ASSERT_TRUE(engine->observePlayerMove(Board::fromString("X--------"), 8));
    engine->getSelector().update(Strategy::CORNERS, StrategySelector::Outcome::WIN);

    std::string bandit = engine->serializeBandit();
    std::string bayesian = engine->serializeBayesian();

    AdaptiveEngine fresh(AdaptiveEngine::Config::seeded(1));
    EXPECT_EQ(fresh.deserializeBandit(bandit).status, LoadResult::LOADED);
    EXPECT_EQ(fresh.deserializeBayesian(bayesian).status, LoadResult::LOADED);
    EXPECT_EQ(fresh.getSelector().getArm(Strategy::CORNERS).wins, 2);
    EXPECT_EQ(fresh.getBayesianStats().totalPatterns, 1);
}

TEST_F(AdaptiveEngineTest, ResetLearningRestoresSeeds) {
    MemoryBlobStore blobs;
    ASSERT_TRUE(engine->observePlayerMove(Board(), 0));
    engine->getSelector().update(Strategy::MCTS, StrategySelector::Outcome::WIN);
    ASSERT_TRUE(engine->getLearningStore().save(blobs));

    EXPECT_TRUE(engine->resetLearning(&blobs));

    EXPECT_EQ(engine->getBayesianStats().totalPatterns, 0);
    EXPECT_EQ(engine->getSelector().getArm(Strategy::MCTS).wins, 1);
    EXPECT_EQ(blobs.size(), 0u);
}

TEST_F(AdaptiveEngineTest, SameSeedSameMoves) {
    AdaptiveEngine::Config config = AdaptiveEngine::Config::seeded(5);
    config.mcts.maxIterations = 300;
    AdaptiveEngine first(config);
    AdaptiveEngine second(config);
    Board b = Board::fromString("X--------");
    for (Difficulty difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
        EXPECT_EQ(first.computeMove(b, Board::O, Variant::CLASSIC, PieceHistory(), PieceHistory(), difficulty),
                  second.computeMove(b, Board::O, Variant::CLASSIC, PieceHistory(), PieceHistory(), difficulty));
    }
}

#include <gtest/gtest.h>
#include "AdaptiveEngine.hpp"
#include "GameUtils.hpp"
#include "Minimax.hpp"
#include "TicTacToeGame.hpp"
#include <memory>
#include <string>
#include <vector>

class CompleteGamesTest : public ::testing::Test {
protected:
    static constexpr int MAX_GAME_MOVES = 60;

    struct GameResult {
        Board::Mark winner = Board::EMPTY;
        int moveCount = 0;
        bool completed = false;
        std::string terminationReason;
    };

    // Walks every reply the opponent could make and lets the search answer
    // each one. Records the first line that ends in a loss.
    void exploreAllReplies(Minimax& minimax, TicTacToeGame& game, Board::Mark aiMark,
                           std::vector<int>& line, int& gamesPlayed, std::string& firstLoss) {
        if (!firstLoss.empty()) {
            return;
        }
        if (game.isGameOver()) {
            gamesPlayed++;
            if (game.getWinner() == Board::opponent(aiMark)) {
                for (int move : line) {
                    firstLoss += GameUtils::displayMove(move) + " ";
                }
            }
            return;
        }

        if (game.getCurrentPlayer() == aiMark) {
            int move = minimax.bestMove(game.getBoard(), aiMark, Difficulty::HARD);
            ASSERT_TRUE(game.makeMove(move)) << "illegal search move " << move;
            line.push_back(move);
            exploreAllReplies(minimax, game, aiMark, line, gamesPlayed, firstLoss);
            line.pop_back();
            game.undoMove();
            return;
        }

        for (int reply : game.getBoard().getEmptyCells()) {
            ASSERT_TRUE(game.makeMove(reply));
            line.push_back(reply);
            exploreAllReplies(minimax, game, aiMark, line, gamesPlayed, firstLoss);
            line.pop_back();
            game.undoMove();
        }
    }

    GameResult playEngineGame(AdaptiveEngine& xEngine, AdaptiveEngine& oEngine,
                              const TicTacToeGame::Config& config,
                              Difficulty xDifficulty, Difficulty oDifficulty) {
        TicTacToeGame game(config);
        GameResult result;

        for (int moveNum = 0; moveNum < MAX_GAME_MOVES; moveNum++) {
            if (game.isGameOver()) {
                result.winner = game.getWinner();
                result.completed = true;
                result.terminationReason = "normal termination";
                break;
            }

            bool xToMove = game.getCurrentPlayer() == Board::X;
            AdaptiveEngine& mover = xToMove ? xEngine : oEngine;
            AdaptiveEngine& watcher = xToMove ? oEngine : xEngine;

            int move = mover.computeMove(game, xToMove ? xDifficulty : oDifficulty);
            if (!game.isLegalMove(move)) {
                result.terminationReason = "engine returned illegal move " + std::to_string(move);
                return result;
            }
            if (!watcher.observePlayerMove(game.getBoard(), move)) {
                result.terminationReason = "observation rejected";
                return result;
            }
            if (!game.makeMove(move)) {
                result.terminationReason = "move rejected";
                return result;
            }
            result.moveCount++;
        }

        if (!result.completed) {
            result.terminationReason = "move limit";
        }
        xEngine.recordGameOutcome(result.winner, Board::X);
        oEngine.recordGameOutcome(result.winner, Board::O);
        return result;
    }

    static AdaptiveEngine::Config fastConfig(uint32_t seed) {
        AdaptiveEngine::Config config = AdaptiveEngine::Config::seeded(seed);
        config.mcts.maxIterations = 300;
        return config;
    }
};

TEST_F(CompleteGamesTest, SearchNeverLosesAsX) {
    Minimax::Config config;
    config.seed = 1;
    Minimax minimax(config);
    TicTacToeGame game;
    std::vector<int> line;
    int gamesPlayed = 0;
    std::string firstLoss;

    exploreAllReplies(minimax, game, Board::X, line, gamesPlayed, firstLoss);

    EXPECT_TRUE(firstLoss.empty()) << "lost after " << firstLoss;
    EXPECT_GT(gamesPlayed, 0);
}

TEST_F(CompleteGamesTest, SearchNeverLosesAsO) {
    Minimax::Config config;
    config.seed = 2;
    Minimax minimax(config);
    TicTacToeGame game;
    std::vector<int> line;
    int gamesPlayed = 0;
    std::string firstLoss;

    exploreAllReplies(minimax, game, Board::O, line, gamesPlayed, firstLoss);

    EXPECT_TRUE(firstLoss.empty()) << "lost after " << firstLoss;
    // Every first move by X is answered
    EXPECT_GE(gamesPlayed, Board::CELLS);
}

TEST_F(CompleteGamesTest, HardVersusHardClassicIsDrawn) {
    AdaptiveEngine xEngine(fastConfig(10));
    AdaptiveEngine oEngine(fastConfig(20));
    xEngine.getMinimax().setOpponentModel(nullptr);
    oEngine.getMinimax().setOpponentModel(nullptr);

    // Pin both sides to the exact search
    for (int i = 0; i < 500; i++) {
        xEngine.getSelector().update(Strategy::MINIMAX, StrategySelector::Outcome::WIN);
        oEngine.getSelector().update(Strategy::MINIMAX, StrategySelector::Outcome::WIN);
        for (Strategy strategy : ALL_STRATEGIES) {
            if (strategy != Strategy::MINIMAX) {
                xEngine.getSelector().update(strategy, StrategySelector::Outcome::LOSS);
                oEngine.getSelector().update(strategy, StrategySelector::Outcome::LOSS);
            }
        }
    }

    GameResult result = playEngineGame(xEngine, oEngine, TicTacToeGame::Config::classic(),
                                       Difficulty::HARD, Difficulty::HARD);
    ASSERT_TRUE(result.completed) << result.terminationReason;
    EXPECT_EQ(result.winner, Board::EMPTY);
    EXPECT_EQ(result.moveCount, Board::CELLS);
}

TEST_F(CompleteGamesTest, ClassicGamesFinishAtEveryDifficulty) {
    AdaptiveEngine xEngine(fastConfig(31));
    AdaptiveEngine oEngine(fastConfig(32));

    for (Difficulty difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
        for (int i = 0; i < 3; i++) {
            GameResult result = playEngineGame(xEngine, oEngine, TicTacToeGame::Config::classic(),
                                               difficulty, Difficulty::HARD);
            ASSERT_TRUE(result.completed) << result.terminationReason;
            EXPECT_LE(result.moveCount, Board::CELLS);
        }
    }
    // Both engines learned something from watching each other
    EXPECT_GT(xEngine.getBayesianStats().totalPatterns, 0);
    EXPECT_GT(oEngine.getBayesianStats().totalPatterns, 0);
}

TEST_F(CompleteGamesTest, LimitedGamesStayLegal) {
    AdaptiveEngine xEngine(fastConfig(41));
    AdaptiveEngine oEngine(fastConfig(42));

    for (Difficulty difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
        GameResult result = playEngineGame(xEngine, oEngine, TicTacToeGame::Config::limited(),
                                           difficulty, difficulty);
        EXPECT_TRUE(result.completed || result.terminationReason == "move limit")
            << result.terminationReason;
        EXPECT_LE(result.moveCount, MAX_GAME_MOVES);
    }
}

TEST_F(CompleteGamesTest, LearningPersistsAcrossEngines) {
    AdaptiveEngine xEngine(fastConfig(51));
    AdaptiveEngine oEngine(fastConfig(52));
    for (int i = 0; i < 4; i++) {
        playEngineGame(xEngine, oEngine, TicTacToeGame::Config::classic(),
                       Difficulty::MEDIUM, Difficulty::HARD);
    }

    MemoryBlobStore blobs;
    ASSERT_TRUE(oEngine.getLearningStore().save(blobs));

    AdaptiveEngine restored(fastConfig(53));
    LearningStore::LoadReport report = restored.getLearningStore().load(blobs);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(restored.getBayesianStats().totalPatterns, oEngine.getBayesianStats().totalPatterns);

    int before = 0;
    int after = 0;
    for (const auto& arm : oEngine.getBanditStats().strategies) before += arm.total;
    for (const auto& arm : restored.getBanditStats().strategies) after += arm.total;
    EXPECT_EQ(before, after);
    // Four games on top of the 3-game seed of each arm
    EXPECT_EQ(before, NUM_STRATEGIES * 3 + 4);
}

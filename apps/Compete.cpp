#include "AdaptiveEngine.hpp"
#include "GameUtils.hpp"
#include "Match.hpp"
#include "Profiler.hpp"
#include "TicTacToeGame.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// How to run:
//   ./compete [classic|limited] [--games N] [--x hard] [--o medium] [--seed S]
//   ./compete [classic|limited] --position "1. b2 a1 2. c3"
// The first form plays N games between two engines; the X engine always
// opens. The second form replays a game and reports what
// each search would play next.

namespace {

int analyzePosition(const char* gameStr, const TicTacToeGame::Config& config, uint32_t seed) {
    std::vector<int> moves;
    if (!GameUtils::parseGameString(gameStr, moves)) {
        std::cerr << "Could not parse game string: " << gameStr << "\n";
        return 1;
    }

    TicTacToeGame game(config);
    for (int move : moves) {
        if (!game.makeMove(move)) {
            std::cerr << "Illegal move in game string: " << GameUtils::displayMove(move) << "\n";
            return 1;
        }
    }
    GameUtils::printGameState(game);
    if (game.isGameOver()) {
        std::cout << "Game is over.\n";
        return 0;
    }

    AdaptiveEngine engine(AdaptiveEngine::Config::seeded(seed));
    Board::Mark mark = game.getCurrentPlayer();
    const Board& board = game.getBoard();
    const PieceHistory& own = game.getHistory(mark);
    const PieceHistory& opp = game.getHistory(Board::opponent(mark));

    if (game.isLimited()) {
        LimitedSearch limited;
        std::cout << "Limited search: " << GameUtils::displayMove(limited.bestMove(board, mark, own, opp)) << "\n";
    } else {
        Minimax& minimax = engine.getMinimax();
        int move = minimax.bestMove(board, mark, Difficulty::HARD);
        const Minimax::SearchStats& stats = minimax.getLastStats();
        std::cout << "Minimax: " << GameUtils::displayMove(move) << " (" << stats.reason
                  << ", " << GameUtils::formatWithCommas(stats.nodesSearched) << " nodes)\n";
    }

    MCTS& mcts = engine.getMCTS();
    mcts.bestMove(board, mark, game.isLimited() ? &own : nullptr, game.isLimited() ? &opp : nullptr);
    mcts.printStats();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Variant variant = Variant::CLASSIC;
    Difficulty xDifficulty = Difficulty::HARD;
    Difficulty oDifficulty = Difficulty::HARD;
    int games = 100;
    uint32_t seed = 42;
    const char* position = nullptr;

    for (int i = 1; i < argc; i++) {
        bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "--games") == 0 && hasValue) {
            games = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--seed") == 0 && hasValue) {
            seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--position") == 0 && hasValue) {
            position = argv[++i];
        } else if (std::strcmp(argv[i], "--x") == 0 && hasValue) {
            if (!GameUtils::parseDifficulty(argv[++i], xDifficulty)) {
                std::cerr << "Unknown difficulty: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--o") == 0 && hasValue) {
            if (!GameUtils::parseDifficulty(argv[++i], oDifficulty)) {
                std::cerr << "Unknown difficulty: " << argv[i] << "\n";
                return 1;
            }
        } else if (!GameUtils::parseVariant(argv[i], variant)) {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            return 1;
        }
    }

    TicTacToeGame::Config config = variant == Variant::LIMITED
        ? TicTacToeGame::Config::limited()
        : TicTacToeGame::Config::classic();

    if (position) {
        return analyzePosition(position, config, seed);
    }

    std::cout << "Playing " << games << " " << GameUtils::variantName(variant) << " games: X ("
              << GameUtils::difficultyName(xDifficulty) << ") vs O ("
              << GameUtils::difficultyName(oDifficulty) << ")" << std::endl;

    AdaptiveEngine xEngine(AdaptiveEngine::Config::seeded(seed));
    AdaptiveEngine oEngine(AdaptiveEngine::Config::seeded(seed + 100));
    MatchResult result;

    for (int g = 0; g < games; g++) {
        GameRecord record = Match::playGame(xEngine, oEngine, xDifficulty, oDifficulty, config);
        result.add(record);
        if (record.aborted) {
            std::cerr << "Error: game " << (g + 1) << " aborted: " << record.error << "\n";
            break;
        }
    }

    std::cout << "X wins: " << result.xWins << "  O wins: " << result.oWins
              << "  Draws: " << result.draws << "\n";
    if (result.aborted > 0) {
        std::cout << "Aborted: " << result.aborted << "\n";
    }
    std::cout << "Moves played: " << GameUtils::formatWithCommas(result.moves) << "\n";
    std::cout << "X total time: " << result.xTime << "s  O total time: " << result.oTime << "s\n";

    std::cout << "\nX engine";
    xEngine.getSelector().printStats();
    std::cout << "O engine";
    oEngine.getSelector().printStats();
    GameUtils::printLearningStats(oEngine);
    Profiler::instance().printReport();
    return result.aborted > 0 ? 1 : 0;
}

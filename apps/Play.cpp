#include "AdaptiveEngine.hpp"
#include "GameUtils.hpp"
#include "LearningStore.hpp"
#include "Profiler.hpp"
#include "TicTacToeGame.hpp"
#include <cstring>
#include <iostream>
#include <string>

// How to run: ./play [classic|limited] [easy|medium|hard] [--data DIR] [--first o] [--reset]
// Learned state is read from DIR (default ./ttt_data) and written back after
// every game and on exit.

namespace {

void reportLoad(const char* name, const LoadResult& result) {
    if (result.status == LoadResult::LOADED) {
        std::cout << "Loaded " << name << " (" << result.loadedEntries << " entries)\n";
    } else if (result.status == LoadResult::NOT_FOUND) {
        std::cout << "No saved " << name << ", starting fresh\n";
    } else {
        std::cerr << "Warning: " << name << " " << LoadResult::statusName(result.status)
                  << ": loaded " << result.loadedEntries << ", skipped " << result.skippedEntries;
        if (!result.diagnostic.empty()) {
            std::cerr << " (" << result.diagnostic << ")";
        }
        std::cerr << "\n";
    }
}

void save(AdaptiveEngine& engine, BlobStore& store) {
    if (!engine.getLearningStore().save(store)) {
        std::cerr << "Warning: could not save learning data\n";
    }
}

void printHelp() {
    std::cout << "Enter a move as 1-9 or a1-c3. Commands: hint, stats, undo, reset, quit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Variant variant = Variant::CLASSIC;
    Difficulty difficulty = Difficulty::HARD;
    std::string dataDir = "ttt_data";
    Board::Mark human = Board::X;
    bool resetFirst = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--data") == 0 && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (std::strcmp(argv[i], "--first") == 0 && i + 1 < argc) {
            human = (std::strcmp(argv[++i], "o") == 0) ? Board::O : Board::X;
        } else if (std::strcmp(argv[i], "--reset") == 0) {
            resetFirst = true;
        } else if (!GameUtils::parseVariant(argv[i], variant) &&
                   !GameUtils::parseDifficulty(argv[i], difficulty)) {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            return 1;
        }
    }

    // X always opens; "--first o" hands X to the AI
    Board::Mark aiMark = Board::opponent(human);

    std::cout << "Playing tic-tac-toe (" << GameUtils::variantName(variant) << ", "
              << GameUtils::difficultyName(difficulty) << ")" << std::endl;

    FileBlobStore store(dataDir);
    AdaptiveEngine engine;

    if (resetFirst) {
        if (!engine.resetLearning(&store)) {
            std::cerr << "Warning: could not erase saved learning data\n";
        }
    } else {
        LearningStore::LoadReport report = engine.getLearningStore().load(store);
        reportLoad("bandit", report.bandit);
        reportLoad("opponent model", report.bayesian);
    }
    printHelp();

    TicTacToeGame::Config config = variant == Variant::LIMITED
        ? TicTacToeGame::Config::limited()
        : TicTacToeGame::Config::classic();

    bool quit = false;
    int games = 0;
    int humanWins = 0;
    int aiWins = 0;
    int draws = 0;

    while (!quit) {
        TicTacToeGame game(config);

        while (!game.isGameOver()) {
            GameUtils::printGameState(game);

            if (game.getCurrentPlayer() == aiMark) {
                int move = engine.computeMove(game, difficulty);
                if (!game.makeMove(move)) {
                    std::cerr << "Error: engine produced illegal move " << move << "\n";
                    return 1;
                }
                std::cout << "AI plays " << GameUtils::displayMove(move)
                          << " [" << engine.getLastSource() << "]\n\n";
                continue;
            }

            std::cout << "Your move: ";
            std::string input;
            if (!std::getline(std::cin, input)) {
                quit = true;
                break;
            }

            if (input == "quit" || input == "q") {
                quit = true;
                break;
            } else if (input == "help") {
                printHelp();
            } else if (input == "stats") {
                engine.getSelector().printStats();
                GameUtils::printLearningStats(engine);
            } else if (input == "reset") {
                if (!engine.resetLearning(&store)) {
                    std::cerr << "Warning: could not erase saved learning data\n";
                }
                std::cout << "Learning data reset.\n";
            } else if (input == "hint") {
                const PieceHistory* own = game.isLimited() ? &game.getHistory(human) : nullptr;
                const PieceHistory* opp = game.isLimited() ? &game.getHistory(aiMark) : nullptr;
                int hint = engine.getMCTS().bestMove(game.getBoard(), human, own, opp);
                engine.getMCTS().printStats();
                std::cout << "Hint: " << GameUtils::displayMove(hint) << "\n";
            } else if (input == "undo") {
                // Take back the AI reply and the human move before it
                if (game.getMoveCount() >= 2) {
                    game.undoMove();
                    game.undoMove();
                } else {
                    std::cout << "Nothing to undo.\n";
                }
            } else {
                int move = GameUtils::parseMove(input.c_str());
                if (!game.isLegalMove(move)) {
                    std::cout << "Invalid or illegal move: " << input << "\n";
                    continue;
                }
                if (!engine.observePlayerMove(game.getBoard(), move) || !game.makeMove(move)) {
                    std::cerr << "Error: could not apply move " << input << "\n";
                }
            }
        }

        if (!game.isGameOver()) {
            break;
        }

        GameUtils::printGameState(game);
        Board::Mark winner = game.getWinner();
        engine.recordGameOutcome(winner, aiMark);
        games++;

        if (winner == human) {
            humanWins++;
            std::cout << "You win!\n";
        } else if (winner == aiMark) {
            aiWins++;
            std::cout << "AI wins.\n";
        } else {
            draws++;
            std::cout << "Draw.\n";
        }
        save(engine, store);

        std::cout << "Play again? [y/n] ";
        std::string again;
        if (!std::getline(std::cin, again) || (again != "y" && again != "yes")) {
            quit = true;
        }
    }

    save(engine, store);

    std::cout << "\nGames: " << games << "  You: " << humanWins
              << "  AI: " << aiWins << "  Draws: " << draws << "\n";
    Profiler::instance().printReport();
    return 0;
}

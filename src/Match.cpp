#include "Match.hpp"
#include "AdaptiveEngine.hpp"
#include "GameUtils.hpp"
#include <chrono>

void MatchResult::add(const GameRecord& record) {
    if (record.aborted) {
        aborted++;
        return;
    }
    if (record.winner == Board::X) {
        xWins++;
    } else if (record.winner == Board::O) {
        oWins++;
    } else {
        draws++;
    }
    moves += record.moves;
    xTime += record.xSeconds;
    oTime += record.oSeconds;
}

GameRecord Match::playGame(AdaptiveEngine& xEngine, AdaptiveEngine& oEngine,
                           Difficulty xDifficulty, Difficulty oDifficulty,
                           const TicTacToeGame::Config& config, int maxMoves) {
    TicTacToeGame game(config);
    GameRecord record;

    while (!game.isGameOver() && game.getMoveCount() < maxMoves) {
        bool xToMove = game.getCurrentPlayer() == Board::X;
        AdaptiveEngine& mover = xToMove ? xEngine : oEngine;
        AdaptiveEngine& watcher = xToMove ? oEngine : xEngine;

        auto t0 = std::chrono::steady_clock::now();
        int move = mover.computeMove(game, xToMove ? xDifficulty : oDifficulty);
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        (xToMove ? record.xSeconds : record.oSeconds) += elapsed;

        if (!game.isLegalMove(move) || !watcher.observePlayerMove(game.getBoard(), move) ||
            !game.makeMove(move)) {
            record.aborted = true;
            record.error = std::string("illegal move ") + GameUtils::displayMove(move) +
                           " from " + (xToMove ? "X" : "O");
            return record;
        }
        record.moves++;
    }

    record.hitMoveLimit = !game.isGameOver();
    record.winner = game.getWinner();
    xEngine.recordGameOutcome(record.winner, Board::X);
    oEngine.recordGameOutcome(record.winner, Board::O);
    return record;
}

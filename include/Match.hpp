#ifndef MATCH_HPP
#define MATCH_HPP

#include "Board.hpp"
#include "TicTacToeGame.hpp"
#include <string>

class AdaptiveEngine;

// ============================================================================
// Match - engine-vs-engine games and their tally
// ============================================================================

struct GameRecord {
    Board::Mark winner = Board::EMPTY;
    int moves = 0;
    bool aborted = false;     // an engine produced a move the game rejected
    bool hitMoveLimit = false;
    double xSeconds = 0.0;
    double oSeconds = 0.0;
    std::string error;
};

struct MatchResult {
    int xWins = 0;
    int oWins = 0;
    int draws = 0;
    int aborted = 0;
    int moves = 0;
    double xTime = 0.0;
    double oTime = 0.0;

    void add(const GameRecord& record);
    int gamesPlayed() const { return xWins + oWins + draws; }
};

class Match {
public:
    // Limited games can cycle forever between strong players
    static constexpr int MAX_GAME_MOVES = 60;

    // Plays one game with X opening. Each engine observes the other's
    // moves; outcomes are recorded only for games that were not aborted.
    static GameRecord playGame(AdaptiveEngine& xEngine, AdaptiveEngine& oEngine,
                               Difficulty xDifficulty, Difficulty oDifficulty,
                               const TicTacToeGame::Config& config,
                               int maxMoves = MAX_GAME_MOVES);
};

#endif // MATCH_HPP

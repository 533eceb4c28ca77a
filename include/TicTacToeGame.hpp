#ifndef TICTACTOEGAME_HPP
#define TICTACTOEGAME_HPP

#include "Board.hpp"
#include <vector>

class TicTacToeGame {
public:
    struct Config {
        Variant variant = Variant::CLASSIC;
        Board::Mark firstPlayer = Board::X;

        Config() {}

        static Config classic() { return Config(); }
        static Config limited() {
            Config config;
            config.variant = Variant::LIMITED;
            return config;
        }
    };

    struct MoveInfo {
        int move;
        int evicted;          // Board::NO_MOVE unless a piece was removed
        Board::Mark player;   // Who made this move
    };

    explicit TicTacToeGame(const Config& config = Config());

    // Core game functions
    void reset();
    bool makeMove(int index);  // Returns false if illegal or game over
    void undoMove();

    // Game state queries
    Board::Mark getCurrentPlayer() const { return currentPlayer_; }
    Board::Mark getWinner() const { return board_.getWinner(); }
    bool isGameOver() const;
    bool isDraw() const;
    bool isLegalMove(int index) const;

    // State access
    const Board& getBoard() const { return board_; }
    const PieceHistory& getHistory(Board::Mark player) const;
    int getNextEviction() const;  // piece the current player loses next, or NO_MOVE
    int getMoveCount() const { return static_cast<int>(moveHistory_.size()); }
    const std::vector<MoveInfo>& getMoveHistory() const { return moveHistory_; }
    bool canUndo() const { return !moveHistory_.empty(); }
    const Config& getConfig() const { return config_; }
    bool isLimited() const { return config_.variant == Variant::LIMITED; }

private:
    Config config_;
    Board board_;
    PieceHistory xHistory_;
    PieceHistory oHistory_;
    Board::Mark currentPlayer_;
    std::vector<MoveInfo> moveHistory_;

    PieceHistory& historyFor(Board::Mark player);
};

#endif // TICTACTOEGAME_HPP

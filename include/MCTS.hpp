#ifndef MCTS_HPP
#define MCTS_HPP

#include "Board.hpp"
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

// ============================================================================
// MCTS - UCB1 tree search with uniform random playouts
// ============================================================================
// Nodes live in a vector arena and refer to each other by index. The arena
// is cleared at the start of every search; no tree is reused across calls.

class MCTS {
public:
    // Configuration parameters
    struct Config {
        int maxIterations = 1000;      // Number of MCTS iterations
        int timeBudgetMs = 500;        // Wall-clock cap per search
        double explorationConstant;    // UCB1 exploration parameter
        int maxSimulationDepth = 60;   // Limited variant playout cap, scored as a draw
        uint32_t seed = std::random_device{}();

        Config() : explorationConstant(std::sqrt(2.0)) {}
    };

    struct Node {
        Board board;
        PieceHistory xHistory;   // only maintained in the limited variant
        PieceHistory oHistory;

        int move = Board::NO_MOVE;           // Move that led to this node
        Board::Mark player = Board::EMPTY;   // Player who made that move
        Board::Mark toMove = Board::EMPTY;

        int parent = -1;
        std::vector<int> children;
        std::vector<int> untriedMoves;

        int visits = 0;
        double wins = 0.0;  // from `player`'s point of view

        bool isFullyExpanded() const { return untriedMoves.empty(); }
        double getUCB1Value(double explorationConstant, int parentVisits) const;
    };

    struct MoveStats {
        int move;
        int visits;
        double wins;
        double winRate;
    };

    struct SearchInfo {
        int iterations = 0;
        double elapsedMs = 0.0;
        int rootVisits = 0;
        int treeSize = 0;
        int bestMove = Board::NO_MOVE;
        std::vector<MoveStats> moves;  // sorted by visits, most first
    };

    explicit MCTS(const Config& config = Config());

    // Histories switch on the limited variant (eviction in tree and playouts).
    int bestMove(const Board& board, Board::Mark mark,
                 const PieceHistory* ownHistory = nullptr,
                 const PieceHistory* oppHistory = nullptr);

    // Same search with a reduced iteration budget.
    int bestMove(const Board& board, Board::Mark mark, int iterations,
                 const PieceHistory* ownHistory = nullptr,
                 const PieceHistory* oppHistory = nullptr);

    const SearchInfo& getLastSearchInfo() const { return info_; }
    int getTreeSize() const { return static_cast<int>(nodes_.size()); }
    void printStats() const;

    void setConfig(const Config& config);
    const Config& getConfig() const { return config_; }

private:
    // MCTS phases
    int select(int node) const;
    int expand(int node);
    double simulate(int node);
    void backpropagate(int node, double result);

    int search(const Board& board, Board::Mark mark, int iterations,
               const PieceHistory* ownHistory, const PieceHistory* oppHistory);
    int selectBestChild(int node) const;
    int mostVisitedChild(int node) const;
    bool isTerminal(const Board& board) const;
    void collectInfo(int iterations, double elapsedMs);

    static PieceHistory& historyOf(Node& node, Board::Mark mark) {
        return mark == Board::X ? node.xHistory : node.oHistory;
    }

    // Member variables
    Config config_;
    std::vector<Node> nodes_;
    bool limited_ = false;
    std::mt19937 rng_;
    SearchInfo info_;
};

#endif // MCTS_HPP

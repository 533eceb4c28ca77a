#include "MCTS.hpp"
#include "BoardEvaluator.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <limits>

// ============================================================================
// Node Implementation
// ============================================================================

double MCTS::Node::getUCB1Value(double explorationConstant, int parentVisits) const {
    if (visits == 0) {
        return std::numeric_limits<double>::infinity();
    }
    double exploitation = wins / visits;
    double exploration = explorationConstant *
                         std::sqrt(std::log(static_cast<double>(parentVisits)) / visits);
    return exploitation + exploration;
}

MCTS::MCTS(const Config& config)
    : config_(config)
    , rng_(config.seed) {
}

void MCTS::setConfig(const Config& config) {
    config_ = config;
    rng_.seed(config.seed);
}

// ============================================================================
// Main Search Interface
// ============================================================================

int MCTS::bestMove(const Board& board, Board::Mark mark,
                   const PieceHistory* ownHistory, const PieceHistory* oppHistory) {
    return search(board, mark, config_.maxIterations, ownHistory, oppHistory);
}

int MCTS::bestMove(const Board& board, Board::Mark mark, int iterations,
                   const PieceHistory* ownHistory, const PieceHistory* oppHistory) {
    return search(board, mark, iterations, ownHistory, oppHistory);
}

int MCTS::search(const Board& board, Board::Mark mark, int iterations,
                 const PieceHistory* ownHistory, const PieceHistory* oppHistory) {
    PROFILE_SCOPE("MCTS::search");
    info_ = SearchInfo();
    nodes_.clear();
    limited_ = ownHistory != nullptr && oppHistory != nullptr;

    int tactical = BoardEvaluator::tacticalMove(board, mark, ownHistory, oppHistory);
    if (tactical != Board::NO_MOVE) {
        info_.bestMove = tactical;
        return tactical;
    }

    std::vector<int> legalMoves = board.getEmptyCells();
    if (legalMoves.empty()) {
        return Board::NO_MOVE;
    }
    if (legalMoves.size() == 1) {
        info_.bestMove = legalMoves[0];
        return legalMoves[0];
    }

    auto startTime = std::chrono::steady_clock::now();
    auto elapsedMs = [&startTime]() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(now - startTime).count();
    };

    nodes_.reserve(static_cast<size_t>(std::clamp(iterations, 0, 10000)) + 1);
    Node root;
    root.board = board;
    if (limited_) {
        historyOf(root, mark) = *ownHistory;
        historyOf(root, Board::opponent(mark)) = *oppHistory;
    }
    root.player = Board::opponent(mark);
    root.toMove = mark;
    root.untriedMoves = legalMoves;
    nodes_.push_back(std::move(root));

    int completed = 0;
    while (completed < iterations && elapsedMs() < config_.timeBudgetMs) {
        // Selection: descend until a node still has untried moves
        int node = select(0);

        // Expansion
        if (!nodes_[node].isFullyExpanded()) {
            node = expand(node);
        }

        // Simulation
        double result = simulate(node);

        // Backpropagation
        backpropagate(node, result);

        completed++;
    }

    int best = mostVisitedChild(0);
    int move = best < 0 ? Board::NO_MOVE : nodes_[best].move;

    info_.bestMove = move;
    collectInfo(completed, elapsedMs());
    return move;
}

// ============================================================================
// MCTS Phases
// ============================================================================

int MCTS::select(int node) const {
    PROFILE_SCOPE("MCTS::select");
    while (nodes_[node].isFullyExpanded() && !nodes_[node].children.empty()) {
        node = selectBestChild(node);
    }
    return node;
}

int MCTS::expand(int node) {
    PROFILE_SCOPE("MCTS::expand");
    std::vector<int>& untried = nodes_[node].untriedMoves;
    std::uniform_int_distribution<size_t> pick(0, untried.size() - 1);
    size_t slot = pick(rng_);
    int move = untried[slot];
    untried.erase(untried.begin() + static_cast<std::ptrdiff_t>(slot));

    // Copy before push_back, which may reallocate the arena
    Node child;
    child.board = nodes_[node].board;
    child.xHistory = nodes_[node].xHistory;
    child.oHistory = nodes_[node].oHistory;
    child.move = move;
    child.player = nodes_[node].toMove;
    child.toMove = Board::opponent(child.player);
    child.parent = node;

    if (limited_) {
        child.board.placePiece(move, child.player, historyOf(child, child.player));
    } else {
        child.board.set(move, child.player);
    }
    if (!isTerminal(child.board)) {
        child.untriedMoves = child.board.getEmptyCells();
    }

    int index = static_cast<int>(nodes_.size());
    nodes_.push_back(std::move(child));
    nodes_[node].children.push_back(index);
    return index;
}

double MCTS::simulate(int node) {
    PROFILE_SCOPE("MCTS::simulate");
    const Node& start = nodes_[node];
    Board board = start.board;
    PieceHistory xHistory = start.xHistory;
    PieceHistory oHistory = start.oHistory;
    Board::Mark current = start.toMove;
    const Board::Mark perspective = start.player;
    int depth = 0;

    while (true) {
        Board::Mark winner = board.getWinner();
        if (winner != Board::EMPTY) {
            return winner == perspective ? 1.0 : 0.0;
        }

        std::vector<int> moves = board.getEmptyCells();
        if (moves.empty()) {
            return 0.5;
        }
        // Eviction can cycle forever; cap and call it a draw
        if (limited_ && depth >= config_.maxSimulationDepth) {
            return 0.5;
        }

        std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
        int move = moves[pick(rng_)];
        if (limited_) {
            board.placePiece(move, current, current == Board::X ? xHistory : oHistory);
        } else {
            board.set(move, current);
        }
        current = Board::opponent(current);
        depth++;
    }
}

void MCTS::backpropagate(int node, double result) {
    PROFILE_SCOPE("MCTS::backpropagate");
    double currentResult = result;
    while (node >= 0) {
        Node& current = nodes_[node];
        current.visits++;
        current.wins += currentResult;

        // Flip result for parent (opponent's perspective)
        currentResult = 1.0 - currentResult;
        node = current.parent;
    }
}

// ============================================================================
// Helper Methods
// ============================================================================

int MCTS::selectBestChild(int node) const {
    const Node& parent = nodes_[node];
    int bestChild = -1;
    double bestValue = -std::numeric_limits<double>::infinity();

    for (int child : parent.children) {
        double value = nodes_[child].getUCB1Value(config_.explorationConstant, parent.visits);
        if (value > bestValue) {
            bestValue = value;
            bestChild = child;
        }
    }

    if (bestChild < 0) {
        bestChild = parent.children.front();
    }
    return bestChild;
}

int MCTS::mostVisitedChild(int node) const {
    int bestChild = -1;
    int maxVisits = -1;
    for (int child : nodes_[node].children) {
        if (nodes_[child].visits > maxVisits) {
            maxVisits = nodes_[child].visits;
            bestChild = child;
        }
    }
    return bestChild;
}

bool MCTS::isTerminal(const Board& board) const {
    if (board.getWinner() != Board::EMPTY) {
        return true;
    }
    return board.isFull();
}

void MCTS::collectInfo(int iterations, double elapsedMs) {
    info_.iterations = iterations;
    info_.elapsedMs = elapsedMs;
    info_.treeSize = getTreeSize();
    if (nodes_.empty()) {
        return;
    }
    info_.rootVisits = nodes_[0].visits;

    for (int child : nodes_[0].children) {
        const Node& n = nodes_[child];
        MoveStats stats;
        stats.move = n.move;
        stats.visits = n.visits;
        stats.wins = n.wins;
        stats.winRate = n.visits > 0 ? n.wins / n.visits : 0.0;
        info_.moves.push_back(stats);
    }
    std::stable_sort(info_.moves.begin(), info_.moves.end(),
        [](const MoveStats& a, const MoveStats& b) {
            return a.visits > b.visits;
        });
}

void MCTS::printStats() const {
    std::cout << "\n=== MCTS Statistics ===\n";
    std::cout << "Iterations: " << GameUtils::formatWithCommas(info_.iterations)
              << ". Tree size: " << GameUtils::formatWithCommas(info_.treeSize)
              << ". Root visits: " << GameUtils::formatWithCommas(info_.rootVisits) << "\n";
    std::cout << "Search time: " << std::fixed << std::setprecision(1)
              << info_.elapsedMs << " ms\n";

    if (info_.moves.empty()) {
        std::cout << "No moves analyzed.\n";
    } else {
        std::cout << std::setw(6) << "Move"
                  << std::setw(10) << "Visits"
                  << std::setw(10) << "Wins"
                  << std::setw(10) << "WinRate" << "\n";
        std::cout << std::string(36, '-') << "\n";
        for (const auto& stats : info_.moves) {
            std::cout << std::setw(6) << GameUtils::displayMove(stats.move)
                      << std::setw(10) << stats.visits
                      << std::setw(10) << std::fixed << std::setprecision(1) << stats.wins
                      << std::setw(10) << std::fixed << std::setprecision(3) << stats.winRate
                      << "\n";
        }
    }

    if (info_.bestMove != Board::NO_MOVE) {
        std::cout << "Best move: " << GameUtils::displayMove(info_.bestMove) << "\n";
    }
    std::cout << "=======================\n\n";
}

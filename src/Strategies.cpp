#include "Strategies.hpp"
#include "BoardEvaluator.hpp"
#include <vector>

const char* strategyName(Strategy strategy) {
    switch (strategy) {
    case Strategy::MINIMAX:
        return "minimax";
    case Strategy::MCTS:
        return "mcts";
    case Strategy::BAYESIAN:
        return "bayesian";
    case Strategy::AGGRESSIVE:
        return "aggressive";
    case Strategy::DEFENSIVE:
        return "defensive";
    case Strategy::CORNERS:
        return "corners";
    case Strategy::CENTER:
        return "center";
    case Strategy::RANDOM:
        return "random";
    }
    return "unknown";
}

std::optional<Strategy> parseStrategy(const std::string& name) {
    for (Strategy strategy : ALL_STRATEGIES) {
        if (name == strategyName(strategy)) {
            return strategy;
        }
    }
    return std::nullopt;
}

template <size_t N>
int Strategies::pickRandomEmpty(const Board& board, const int (&cells)[N], std::mt19937& rng) {
    std::vector<int> open;
    for (int cell : cells) {
        if (board.isEmpty(cell)) {
            open.push_back(cell);
        }
    }
    if (open.empty()) {
        return Board::NO_MOVE;
    }
    std::uniform_int_distribution<size_t> pick(0, open.size() - 1);
    return open[pick(rng)];
}

int Strategies::random(const Board& board, std::mt19937& rng) {
    std::vector<int> moves = board.getEmptyCells();
    if (moves.empty()) {
        return Board::NO_MOVE;
    }
    std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
    return moves[pick(rng)];
}

int Strategies::openLineScore(const Board& board, Board::Mark ai, int cell) {
    Board test = board;
    test.set(cell, ai);

    int score = 0;
    for (const auto& line : Board::LINES) {
        int own = 0;
        bool open = true;
        for (int c : line) {
            Board::Mark m = test.get(c);
            if (m == ai) {
                own++;
            } else if (m != Board::EMPTY) {
                open = false;
            }
        }
        if (open) {
            score += 1;
            if (own >= 2) {
                score += 3;
            }
        }
    }
    return score;
}

int Strategies::opponentOpportunities(const Board& board, Board::Mark ai, int cell) {
    Board test = board;
    test.set(cell, ai);
    Board::Mark opp = Board::opponent(ai);

    int score = 0;
    for (const auto& line : Board::LINES) {
        int theirs = 0;
        bool open = true;
        for (int c : line) {
            Board::Mark m = test.get(c);
            if (m == opp) {
                theirs++;
            } else if (m == ai) {
                open = false;
            }
        }
        if (open) {
            score += 1;
            if (theirs >= 2) {
                score += 5;
            }
        }
    }
    return score;
}

int Strategies::aggressive(const Board& board, Board::Mark ai, std::mt19937& rng) {
    int move = BoardEvaluator::forkMove(board, ai);
    if (move != Board::NO_MOVE) {
        return move;
    }

    if (board.isEmpty(Board::CENTER)) {
        return Board::CENTER;
    }

    int bestCorner = Board::NO_MOVE;
    int bestScore = 0;
    for (int corner : Board::CORNERS) {
        if (!board.isEmpty(corner)) {
            continue;
        }
        int score = openLineScore(board, ai, corner);
        if (bestCorner == Board::NO_MOVE || score > bestScore) {
            bestScore = score;
            bestCorner = corner;
        }
    }
    if (bestCorner != Board::NO_MOVE) {
        return bestCorner;
    }

    move = pickRandomEmpty(board, Board::SIDES, rng);
    if (move != Board::NO_MOVE) {
        return move;
    }
    return random(board, rng);
}

int Strategies::defensive(const Board& board, Board::Mark ai) {
    int move = BoardEvaluator::forkMove(board, Board::opponent(ai));
    if (move != Board::NO_MOVE) {
        return move;
    }

    if (board.isEmpty(Board::CENTER)) {
        return Board::CENTER;
    }

    int bestMove = Board::NO_MOVE;
    int lowest = 0;
    for (int cell = 0; cell < Board::CELLS; cell++) {
        if (!board.isEmpty(cell)) {
            continue;
        }
        int score = opponentOpportunities(board, ai, cell);
        if (bestMove == Board::NO_MOVE || score < lowest) {
            lowest = score;
            bestMove = cell;
        }
    }
    return bestMove;
}

int Strategies::corners(const Board& board) {
    static constexpr int CORNER_ORDER[4] = {0, 8, 2, 6};
    for (int corner : CORNER_ORDER) {
        if (board.isEmpty(corner)) {
            return corner;
        }
    }

    if (board.isEmpty(Board::CENTER)) {
        return Board::CENTER;
    }

    for (int side : Board::SIDES) {
        if (board.isEmpty(side)) {
            return side;
        }
    }

    std::vector<int> moves = board.getEmptyCells();
    return moves.empty() ? Board::NO_MOVE : moves.front();
}

int Strategies::center(const Board& board, Board::Mark ai, std::mt19937& rng) {
    if (board.isEmpty(Board::CENTER)) {
        return Board::CENTER;
    }

    Board::Mark opp = Board::opponent(ai);
    static constexpr int OPPOSITE_CORNERS[2][2] = {{0, 8}, {2, 6}};
    for (const auto& pair : OPPOSITE_CORNERS) {
        if (board.get(pair[0]) == opp && board.isEmpty(pair[1])) {
            return pair[1];
        }
        if (board.get(pair[1]) == opp && board.isEmpty(pair[0])) {
            return pair[0];
        }
    }

    int move = pickRandomEmpty(board, Board::CORNERS, rng);
    if (move != Board::NO_MOVE) {
        return move;
    }
    move = pickRandomEmpty(board, Board::SIDES, rng);
    if (move != Board::NO_MOVE) {
        return move;
    }
    return random(board, rng);
}

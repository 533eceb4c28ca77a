#include "AdaptiveEngine.hpp"
#include "BoardEvaluator.hpp"
#include "Profiler.hpp"
#include "TicTacToeGame.hpp"

AdaptiveEngine::AdaptiveEngine(const Config& config)
    : config_(config)
    , model_()
    , minimax_(config.minimax)
    , limitedSearch_(config.limited)
    , mcts_(config.mcts)
    , selector_(minimax_, limitedSearch_, mcts_, model_, config.selector)
    , store_(selector_, model_)
    , rng_(config.seed) {
    minimax_.setOpponentModel(&model_);
}

bool AdaptiveEngine::roll(double probability) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_) < probability;
}

int AdaptiveEngine::randomLegalMove(const Board& board) {
    std::vector<int> moves = board.getEmptyCells();
    if (moves.empty()) {
        return Board::NO_MOVE;
    }
    std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
    return moves[pick(rng_)];
}

int AdaptiveEngine::easyMove(const Board& board, Board::Mark aiMark, Variant variant,
                             const PieceHistory& aiHistory, const PieceHistory& oppHistory) {
    const bool limited = variant == Variant::LIMITED;
    int ownEvicted = (limited && aiHistory.isFull()) ? aiHistory.oldest() : Board::NO_MOVE;
    int oppEvicted = (limited && oppHistory.isFull()) ? oppHistory.oldest() : Board::NO_MOVE;

    int win = BoardEvaluator::winningMove(board, aiMark, ownEvicted);
    if (win != Board::NO_MOVE && roll(config_.easyWinChance)) {
        return win;
    }

    int block = BoardEvaluator::winningMove(board, Board::opponent(aiMark), oppEvicted);
    if (block != Board::NO_MOVE && roll(config_.easyBlockChance)) {
        return block;
    }

    if (board.isEmpty(Board::CENTER) && roll(config_.easyCenterChance)) {
        return Board::CENTER;
    }
    return randomLegalMove(board);
}

int AdaptiveEngine::computeMove(const Board& board, Board::Mark aiMark, Variant variant,
                                const PieceHistory& aiHistory, const PieceHistory& oppHistory,
                                Difficulty difficulty) {
    PROFILE_SCOPE("AdaptiveEngine::computeMove");
    if (board.countEmpty() == 0) {
        lastSource_ = "none";
        return Board::NO_MOVE;
    }

    const bool limited = variant == Variant::LIMITED;
    int move = Board::NO_MOVE;

    switch (difficulty) {
    case Difficulty::EASY:
        lastSource_ = "easy";
        move = easyMove(board, aiMark, variant, aiHistory, oppHistory);
        break;

    case Difficulty::MEDIUM:
        if (roll(config_.mediumAdaptiveChance)) {
            move = selector_.chooseMove(board, aiMark, variant, aiHistory, oppHistory, difficulty);
            lastSource_ = strategyName(*selector_.getCurrentStrategy());
        } else {
            lastSource_ = "mcts-lite";
            move = mcts_.bestMove(board, aiMark, config_.mediumMctsIterations,
                                  limited ? &aiHistory : nullptr,
                                  limited ? &oppHistory : nullptr);
        }
        break;

    case Difficulty::HARD:
        move = selector_.chooseMove(board, aiMark, variant, aiHistory, oppHistory, difficulty);
        lastSource_ = strategyName(*selector_.getCurrentStrategy());
        break;
    }

    if (!board.isLegalMove(move)) {
        lastSource_ += "+fallback";
        move = randomLegalMove(board);
    }
    return move;
}

int AdaptiveEngine::computeMove(const TicTacToeGame& game, Difficulty difficulty) {
    Board::Mark aiMark = game.getCurrentPlayer();
    return computeMove(game.getBoard(), aiMark, game.getConfig().variant,
                       game.getHistory(aiMark), game.getHistory(Board::opponent(aiMark)),
                       difficulty);
}

bool AdaptiveEngine::observePlayerMove(const Board& board, int move) {
    return model_.observe(board, move);
}

void AdaptiveEngine::recordGameOutcome(Board::Mark winner, Board::Mark aiMark) {
    selector_.recordOutcome(winner, aiMark);
}

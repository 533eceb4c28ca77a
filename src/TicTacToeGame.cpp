#include "TicTacToeGame.hpp"

TicTacToeGame::TicTacToeGame(const Config& config)
    : config_(config) {
    reset();
}

void TicTacToeGame::reset() {
    board_ = Board();
    xHistory_.clear();
    oHistory_.clear();
    currentPlayer_ = config_.firstPlayer;
    moveHistory_.clear();
    moveHistory_.reserve(Board::CELLS);
}

bool TicTacToeGame::isLegalMove(int index) const {
    return !isGameOver() && board_.isLegalMove(index);
}

bool TicTacToeGame::makeMove(int index) {
    if (!isLegalMove(index)) {
        return false;
    }

    MoveInfo info;
    info.move = index;
    info.player = currentPlayer_;
    info.evicted = Board::NO_MOVE;

    if (isLimited()) {
        info.evicted = board_.placePiece(index, currentPlayer_, historyFor(currentPlayer_));
    } else {
        board_.set(index, currentPlayer_);
    }

    moveHistory_.push_back(info);
    currentPlayer_ = Board::opponent(currentPlayer_);
    return true;
}

void TicTacToeGame::undoMove() {
    if (moveHistory_.empty()) {
        return;
    }

    MoveInfo lastMove = moveHistory_.back();
    moveHistory_.pop_back();

    currentPlayer_ = lastMove.player;
    if (isLimited()) {
        board_.undoPiece(lastMove.move, lastMove.evicted, lastMove.player, historyFor(lastMove.player));
    } else {
        board_.clear(lastMove.move);
    }
}

bool TicTacToeGame::isGameOver() const {
    if (board_.getWinner() != Board::EMPTY) {
        return true;
    }
    // Eviction keeps a limited board from ever filling up
    return !isLimited() && board_.isFull();
}

bool TicTacToeGame::isDraw() const {
    return !isLimited() && board_.isFull() && board_.getWinner() == Board::EMPTY;
}

const PieceHistory& TicTacToeGame::getHistory(Board::Mark player) const {
    return player == Board::X ? xHistory_ : oHistory_;
}

PieceHistory& TicTacToeGame::historyFor(Board::Mark player) {
    return player == Board::X ? xHistory_ : oHistory_;
}

int TicTacToeGame::getNextEviction() const {
    if (!isLimited() || isGameOver()) {
        return Board::NO_MOVE;
    }
    const PieceHistory& history = getHistory(currentPlayer_);
    return history.isFull() ? history.oldest() : Board::NO_MOVE;
}

#include "core/PieceController.hpp"
#include <stdexcept>

namespace mergetris::core {

PieceController::PieceController(const Board& board, double lockDelay)
    : board_{board}
    , lockDelay_{lockDelay}
{
    if (lockDelay < 0.0) {
        throw std::invalid_argument("PieceController: lock delay must not be negative");
    }
}

bool PieceController::fits(const Tetromino& piece) const noexcept {
    // The falling piece is never written into the board before it locks,
    // so an occupied cell always belongs to another block.
    for (const auto& b : piece.blocks()) {
        if (!board_.isEmpty(b.x, b.y)) {
            return false;
        }
    }
    return true;
}

bool PieceController::spawn(const Tetromino& piece) {
    if (!fits(piece)) {
        active_.reset();
        state_ = PieceState::Locked;
        return false;
    }
    active_ = piece;
    state_ = PieceState::Falling;
    lockTimer_ = 0.0;
    return true;
}

bool PieceController::tryOrigin(Position origin) {
    Tetromino moved = *active_;
    moved.setOrigin(origin);
    if (!fits(moved)) {
        return false;
    }
    active_ = moved;
    return true;
}

bool PieceController::move(Direction direction) {
    if (!active_) return false;

    const Position d = offsetFor(direction);
    const Position origin = active_->origin();
    return tryOrigin(Position{origin.x + d.x, origin.y + d.y});
}

bool PieceController::rotateClockwise() {
    if (!active_) return false;

    Tetromino rotated = *active_;
    rotated.rotateClockwise();

    if (fits(rotated)) {
        active_ = rotated;
        return true;
    }

    // Wall kicks: the candidate anchor is only committed when it fits.
    const Position origin = active_->origin();
    for (const auto& kick : WallKicks) {
        rotated.setOrigin(Position{origin.x + kick.x, origin.y + kick.y});
        if (fits(rotated)) {
            active_ = rotated;
            return true;
        }
    }
    return false;
}

bool PieceController::stepDown() {
    if (!active_) return false;

    if (move(Direction::Down)) {
        if (state_ == PieceState::Locking) {
            state_ = PieceState::Falling;
            lockTimer_ = 0.0;
        }
        return true;
    }

    if (state_ == PieceState::Falling) {
        state_ = PieceState::Locking;
        lockTimer_ = 0.0;
    }
    return false;
}

bool PieceController::advanceLockTimer(double dt) noexcept {
    if (!active_ || state_ != PieceState::Locking) {
        return false;
    }
    lockTimer_ += dt;
    return lockTimer_ >= lockDelay_;
}

int PieceController::hardDrop() {
    int cells = 0;
    while (move(Direction::Down)) {
        ++cells;
    }
    return cells;
}

std::optional<Position> PieceController::ghostPosition() const {
    if (!active_) return std::nullopt;

    Tetromino ghost = *active_;
    while (true) {
        const Position prev = ghost.origin();
        ghost.setOrigin(Position{prev.x, prev.y - 1});
        if (!fits(ghost)) {
            return prev;
        }
    }
}

std::vector<Position> PieceController::lock(Board& board) {
    std::vector<Position> written;
    if (!active_) return written;

    const auto cells = active_->blocks();
    const auto& values = active_->values();
    written.reserve(cells.size());

    for (std::size_t i = 0; i < cells.size(); ++i) {
        Block block{values[i], cells[i], true};
        if (!board.place(block, cells[i].x, cells[i].y)) {
            throw std::logic_error("PieceController::lock target cell is not free");
        }
        written.push_back(cells[i]);
    }

    active_.reset();
    state_ = PieceState::Locked;
    lockTimer_ = 0.0;
    return written;
}

bool PieceController::liftUntilFits() {
    if (!active_) return false;

    Position origin = active_->origin();
    while (!fits(*active_)) {
        ++origin.y;
        if (origin.y >= board_.height()) {
            clear();
            return false;
        }
        active_->setOrigin(origin);
    }
    return true;
}

void PieceController::clear() noexcept {
    active_.reset();
    state_ = PieceState::Locked;
    lockTimer_ = 0.0;
}

} // namespace mergetris::core

#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "Types.hpp"
#include <array>
#include <optional>
#include <vector>

namespace mergetris::core {

enum class PieceState {
    Falling,
    Locking,
    Locked
};

// Owns the single falling piece and validates every move against the board.
// The board is not owned; the caller keeps it alive.
class PieceController {
public:
    // Anchor offsets tried, in order, when a rotation collides.
    static constexpr std::array<Position, 5> WallKicks{{
        {1, 0}, {-1, 0}, {0, 1}, {2, 0}, {-2, 0}
    }};

    PieceController(const Board& board, double lockDelay = 0.5);

    const std::optional<Tetromino>& active() const noexcept { return active_; }
    bool hasActive() const noexcept { return active_.has_value(); }
    PieceState state() const noexcept { return state_; }
    double lockTimer() const noexcept { return lockTimer_; }
    double lockDelay() const noexcept { return lockDelay_; }

    // Installs a new falling piece. Returns false (and keeps nothing) when
    // the piece overlaps the stack or the walls.
    bool spawn(const Tetromino& piece);

    bool move(Direction direction);
    bool rotateClockwise();

    // Gravity step: Falling -> Locking when blocked, Locking -> Falling
    // when the piece can fall again.
    bool stepDown();

    // Advances the lock delay while Locking. Returns true once the delay
    // has been reached.
    bool advanceLockTimer(double dt) noexcept;

    // Drops until blocked; returns the number of rows travelled.
    int hardDrop();

    // Lowest anchor the active piece can reach. No side effects.
    std::optional<Position> ghostPosition() const;

    // Writes the piece into the board and discards it. Returns the cells
    // written. Throws std::logic_error if a cell is already taken.
    std::vector<Position> lock(Board& board);

    // Pushes the piece upwards until it no longer overlaps the stack, e.g.
    // after a power-up cascade shifted blocks into it. Returns false when
    // no such position exists below the top of the board.
    bool liftUntilFits();

    void clear() noexcept;

    // True if every cell of the piece is inside and free.
    bool fits(const Tetromino& piece) const noexcept;

private:
    const Board& board_;
    double lockDelay_;

    std::optional<Tetromino> active_;
    PieceState state_{PieceState::Locked};
    double lockTimer_{0.0};

    bool tryOrigin(Position origin);
};

} // namespace mergetris::core

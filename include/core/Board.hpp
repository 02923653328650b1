#pragma once

#include "Types.hpp"
#include <vector>
#include <optional>

namespace mergetris::core {

// A locked tile resting on the board.
struct Block {
    CellValue value{2};
    Position position{};
    bool locked{true};
};

class Board {
public:
    Board(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool isInside(int x, int y) const noexcept {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    // Inside the board and not occupied.
    bool isEmpty(int x, int y) const noexcept;

    std::optional<Block> get(int x, int y) const noexcept;

    // Writes the block at (x, y) and records the position in it.
    // Returns false if the cell is occupied or outside the board.
    bool place(Block block, int x, int y);

    // No-op when the cell is already empty or outside.
    void remove(int x, int y) noexcept;

    // Replaces the value of an occupied cell. Throws std::logic_error on an
    // empty cell and std::invalid_argument on a non power of two.
    void setValue(int x, int y, CellValue value);

    // Destroys full rows bottom-up, shifting everything above down by one.
    // Returns the number of rows cleared.
    int clearCompletedRows();

    // Destroys every block in row y without shifting. Returns blocks removed.
    int clearRow(int y);

    // Compacts every column downwards, keeping the order of blocks.
    // Returns true if any block moved.
    bool applyGravity();

    bool isTopRowOccupied() const noexcept;

    std::optional<int> lowestNonEmptyRow() const noexcept;

    int occupiedCount() const noexcept;

    // Occupied cells, column by column (x outer, y inner).
    std::vector<Position> occupiedPositions() const;

    void clearAll() noexcept;

private:
    int width_;
    int height_;
    std::vector<std::optional<Block>> grid_; // width_ * height_, row-major from the bottom

    int index(int x, int y) const noexcept {
        return y * width_ + x;
    }

    bool isRowComplete(int y) const noexcept;
    void moveRowsDown(int startRow) noexcept;
};

} // namespace mergetris::core

#include "core/Board.hpp"
#include <stdexcept>

namespace mergetris::core {

Board::Board(int width, int height)
    : width_{width}
    , height_{height}
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), std::nullopt);
}

bool Board::isEmpty(int x, int y) const noexcept {
    return isInside(x, y) && !grid_[index(x, y)].has_value();
}

std::optional<Block> Board::get(int x, int y) const noexcept {
    if (!isInside(x, y)) {
        return std::nullopt;
    }
    return grid_[index(x, y)];
}

bool Board::place(Block block, int x, int y) {
    if (!isEmpty(x, y)) {
        return false;
    }
    if (!isPowerOfTwo(block.value)) {
        throw std::invalid_argument("Board::place value is not a power of two");
    }

    block.position = Position{x, y};
    grid_[index(x, y)] = block;
    return true;
}

void Board::remove(int x, int y) noexcept {
    if (isInside(x, y)) {
        grid_[index(x, y)].reset();
    }
}

void Board::setValue(int x, int y, CellValue value) {
    if (!isInside(x, y)) {
        throw std::out_of_range("Board::setValue out of range");
    }
    auto& cell = grid_[index(x, y)];
    if (!cell) {
        throw std::logic_error("Board::setValue on an empty cell");
    }
    if (!isPowerOfTwo(value)) {
        throw std::invalid_argument("Board::setValue value is not a power of two");
    }
    cell->value = value;
}

bool Board::isRowComplete(int y) const noexcept {
    for (int x = 0; x < width_; ++x) {
        if (!grid_[index(x, y)]) {
            return false;
        }
    }
    return true;
}

void Board::moveRowsDown(int startRow) noexcept {
    for (int y = startRow + 1; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            auto& from = grid_[index(x, y)];
            if (from) {
                from->position = Position{x, y - 1};
            }
            grid_[index(x, y - 1)] = from;
            from.reset();
        }
    }
}

int Board::clearCompletedRows() {
    int cleared = 0;

    // Go bottom-up: when we clear, we shift everything above down
    for (int y = 0; y < height_; ++y) {
        if (!isRowComplete(y)) {
            continue;
        }

        clearRow(y);
        moveRowsDown(y);

        ++cleared;
        --y; // re-check this row index because we just pulled everything down
    }

    return cleared;
}

int Board::clearRow(int y) {
    if (y < 0 || y >= height_) {
        throw std::out_of_range("Board::clearRow out of range");
    }

    int removed = 0;
    for (int x = 0; x < width_; ++x) {
        auto& cell = grid_[index(x, y)];
        if (cell) {
            cell.reset();
            ++removed;
        }
    }
    return removed;
}

bool Board::applyGravity() {
    bool moved = false;

    for (int x = 0; x < width_; ++x) {
        // Lowest free slot in this column; blocks settle in scan order.
        int target = 0;
        for (int y = 0; y < height_; ++y) {
            auto& cell = grid_[index(x, y)];
            if (!cell) {
                continue;
            }
            if (target != y) {
                cell->position = Position{x, target};
                grid_[index(x, target)] = cell;
                cell.reset();
                moved = true;
            }
            ++target;
        }
    }

    return moved;
}

bool Board::isTopRowOccupied() const noexcept {
    const int top = height_ - 1;
    for (int x = 0; x < width_; ++x) {
        if (grid_[index(x, top)]) {
            return true;
        }
    }
    return false;
}

std::optional<int> Board::lowestNonEmptyRow() const noexcept {
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (grid_[index(x, y)]) {
                return y;
            }
        }
    }
    return std::nullopt;
}

int Board::occupiedCount() const noexcept {
    int count = 0;
    for (const auto& cell : grid_) {
        if (cell) ++count;
    }
    return count;
}

std::vector<Position> Board::occupiedPositions() const {
    std::vector<Position> out;
    for (int x = 0; x < width_; ++x) {
        for (int y = 0; y < height_; ++y) {
            if (grid_[index(x, y)]) {
                out.push_back(Position{x, y});
            }
        }
    }
    return out;
}

void Board::clearAll() noexcept {
    for (auto& cell : grid_) {
        cell.reset();
    }
}

} // namespace mergetris::core

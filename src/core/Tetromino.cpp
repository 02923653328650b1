#include "core/Tetromino.hpp"

namespace mergetris::core {

namespace {

using Shape = Tetromino::Shape;
using ShapeSet = std::array<Shape, 4>; // indexed by Rotation

// (dx, dy) offsets from the anchor, y up. Cell i of every rotation is the
// same physical cell, so a piece keeps its values when it turns.
constexpr std::array<ShapeSet, TetrominoTypeCount> ShapeTable{{
    // I: horizontal with the anchor second from the left, vertical with the
    // anchor second from the bottom
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {2, 0}}},
        {{{0, -1}, {0, 0}, {0, 1}, {0, 2}}},
        {{{-1, 0}, {0, 0}, {1, 0}, {2, 0}}},
        {{{0, -1}, {0, 0}, {0, 1}, {0, 2}}},
    }},
    // O
    {{
        {{{0, 0}, {1, 0}, {0, 1}, {1, 1}}},
        {{{0, 0}, {1, 0}, {0, 1}, {1, 1}}},
        {{{0, 0}, {1, 0}, {0, 1}, {1, 1}}},
        {{{0, 0}, {1, 0}, {0, 1}, {1, 1}}},
    }},
    // T: nose up, right, down, left
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {0, 1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {1, 0}}},
        {{{-1, 0}, {0, 0}, {1, 0}, {0, -1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {-1, 0}}},
    }},
    // L
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {1, 1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {1, -1}}},
        {{{-1, 0}, {0, 0}, {1, 0}, {-1, -1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {-1, 1}}},
    }},
    // J
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {-1, 1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {1, 1}}},
        {{{-1, 0}, {0, 0}, {1, 0}, {1, -1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {-1, -1}}},
    }},
    // S
    {{
        {{{0, 0}, {1, 0}, {-1, 1}, {0, 1}}},
        {{{0, 0}, {0, 1}, {1, 0}, {1, -1}}},
        {{{0, 0}, {1, 0}, {-1, 1}, {0, 1}}},
        {{{0, 0}, {0, 1}, {1, 0}, {1, -1}}},
    }},
    // Z: the vertical state does not cover its own anchor
    {{
        {{{-1, 0}, {0, 0}, {0, 1}, {1, 1}}},
        {{{1, 0}, {1, 1}, {0, 1}, {0, 2}}},
        {{{-1, 0}, {0, 0}, {0, 1}, {1, 1}}},
        {{{1, 0}, {1, 1}, {0, 1}, {0, 2}}},
    }},
}};

} // namespace

Tetromino::Tetromino(TetrominoType type, Rotation rotation, Position origin, Values values)
    : type_{type}, rotation_{rotation}, origin_{origin}, values_{values}
{
}

void Tetromino::rotateClockwise() noexcept {
    rotation_ = nextRotation(rotation_);
}

Tetromino::Shape Tetromino::blocks() const noexcept {
    Shape cells = shapeFor(type_, rotation_);
    for (auto& cell : cells) {
        cell.x += origin_.x;
        cell.y += origin_.y;
    }
    return cells;
}

Tetromino::Shape Tetromino::shapeFor(TetrominoType type, Rotation rotation) noexcept {
    return ShapeTable[static_cast<std::size_t>(type)][static_cast<std::size_t>(rotation)];
}

} // namespace mergetris::core

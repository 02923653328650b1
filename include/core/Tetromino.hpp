#pragma once // Include guard

#include "Types.hpp" // For Position, Rotation, TetrominoType
#include <array> // For std::array

// Namespace for Mergetris core types
namespace mergetris::core {

// A falling piece: shape, rotation, anchor and the tile value carried by
// each of its four cells.
class Tetromino {
public:
    static constexpr int BlockCount = 4;

    using Shape = std::array<Position, BlockCount>;
    using Values = std::array<CellValue, BlockCount>;

    Tetromino(TetrominoType type, Rotation rotation, Position origin, Values values);

    TetrominoType type() const noexcept { return type_; }
    Rotation rotation() const noexcept { return rotation_; }
    Position origin() const noexcept { return origin_; }
    const Values& values() const noexcept { return values_; }

    void setOrigin(Position p) noexcept { origin_ = p; }
    void setRotation(Rotation r) noexcept { rotation_ = r; }
    void rotateClockwise() noexcept;

    // Positions of the 4 blocks in board coordinates. Block i always
    // carries values()[i].
    Shape blocks() const noexcept;

    // For a given type + rotation, returns block offsets relative to origin (0,0)
    static Shape shapeFor(TetrominoType type, Rotation rotation) noexcept;

private:
    TetrominoType type_;
    Rotation rotation_;
    Position origin_; // anchor cell on the board
    Values values_;
};

} // namespace mergetris::core

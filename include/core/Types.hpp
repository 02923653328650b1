#pragma once // Include guard

#include <cstdint> // For fixed-width integer types

// Namespace for Mergetris core types
namespace mergetris::core {

// Cell coordinates on the board. x grows to the right, y grows upwards:
// y == 0 is the bottom row.
struct Position {
    int x{};
    int y{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Rotation states for Tetrominoes
enum class Rotation : std::uint8_t {
    R0   = 0,
    R90  = 1,
    R180 = 2,
    R270 = 3
};

// Function to get the next rotation state in a clockwise direction
inline Rotation nextRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 1U) % 4U);
}

// Tetromino types
enum class TetrominoType : std::uint8_t {
    I, O, T, L, J, S, Z
};

inline constexpr int TetrominoTypeCount = 7;

inline const char* toString(TetrominoType type) noexcept {
    switch (type) {
    case TetrominoType::I: return "I";
    case TetrominoType::O: return "O";
    case TetrominoType::T: return "T";
    case TetrominoType::L: return "L";
    case TetrominoType::J: return "J";
    case TetrominoType::S: return "S";
    case TetrominoType::Z: return "Z";
    }
    return "?";
}

enum class Direction : std::uint8_t {
    Left,
    Right,
    Down
};

inline Position offsetFor(Direction d) noexcept {
    switch (d) {
    case Direction::Left:  return Position{-1, 0};
    case Direction::Right: return Position{1, 0};
    case Direction::Down:  return Position{0, -1};
    }
    return Position{0, 0};
}

// Tile values are powers of two (2, 4, 8, ...).
using CellValue = std::uint32_t;

inline constexpr bool isPowerOfTwo(CellValue v) noexcept {
    return v >= 2U && (v & (v - 1U)) == 0U;
}

} // namespace mergetris::core

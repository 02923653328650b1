#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <random>

namespace mergetris::core {

// Weighted table for the value of each cell of a new piece.
struct ValueWeight {
    CellValue value;
    double weight;
};

class TetrominoFactory {
public:
    // Non-deterministic seed from std::random_device.
    TetrominoFactory();

    // Deterministic sequence for a given seed.
    explicit TetrominoFactory(std::uint32_t seed);

    // Create next random piece with given origin: uniform shape, each cell
    // value drawn independently from valueWeights().
    Tetromino createRandom(Position origin);

    // Create a piece of a fixed type with random cell values.
    Tetromino create(TetrominoType type, Position origin);

    // 2 -> 3, 4 -> 2, 8 -> 1
    static const std::array<ValueWeight, 3>& valueWeights() noexcept;

private:
    std::mt19937 rng_;
    std::discrete_distribution<int> valueDist_;

    CellValue randomValue();
};

} // namespace mergetris::core

#include "core/TetrominoFactory.hpp"
#include <random>

namespace mergetris::core {

namespace {

std::discrete_distribution<int> makeValueDistribution() {
    const auto& table = TetrominoFactory::valueWeights();
    return std::discrete_distribution<int>{
        table[0].weight, table[1].weight, table[2].weight
    };
}

} // namespace

const std::array<ValueWeight, 3>& TetrominoFactory::valueWeights() noexcept {
    static const std::array<ValueWeight, 3> table{{
        {2U, 3.0},
        {4U, 2.0},
        {8U, 1.0}
    }};
    return table;
}

TetrominoFactory::TetrominoFactory()
    : rng_{std::random_device{}()}
    , valueDist_{makeValueDistribution()}
{
}

TetrominoFactory::TetrominoFactory(std::uint32_t seed)
    : rng_{seed}
    , valueDist_{makeValueDistribution()}
{
}

CellValue TetrominoFactory::randomValue() {
    return valueWeights()[static_cast<std::size_t>(valueDist_(rng_))].value;
}

Tetromino TetrominoFactory::create(TetrominoType type, Position origin) {
    Tetromino::Values values{};
    for (auto& v : values) {
        v = randomValue();
    }
    return Tetromino{type, Rotation::R0, origin, values};
}

Tetromino TetrominoFactory::createRandom(Position origin) {
    std::uniform_int_distribution<int> dist(0, TetrominoTypeCount - 1); // 7 types
    TetrominoType type = static_cast<TetrominoType>(dist(rng_));
    return create(type, origin);
}

} // namespace mergetris::core

#include "core/GameConfig.hpp"
#include <stdexcept>

namespace mergetris::core {

void validate(const GameConfig& config) {
    if (config.board.width < 4 || config.board.height < 4) {
        throw std::invalid_argument("GameConfig: board must be at least 4x4");
    }

    if (config.timing.lockDelay < 0.0) {
        throw std::invalid_argument("GameConfig: lockDelay must not be negative");
    }
    if (config.timing.softDropMultiplier < 1.0) {
        throw std::invalid_argument("GameConfig: softDropMultiplier must be >= 1");
    }

    const auto& s = config.scoring;
    if (s.maxLevel < 1 || s.startingLevel < 1 || s.startingLevel > s.maxLevel) {
        throw std::invalid_argument("GameConfig: startingLevel must be in [1, maxLevel]");
    }
    if (s.linesPerLevel <= 0) {
        throw std::invalid_argument("GameConfig: linesPerLevel must be positive");
    }
    if (s.minInterval <= 0.0 || s.baseInterval < s.minInterval) {
        throw std::invalid_argument("GameConfig: drop intervals must satisfy 0 < min <= base");
    }

    if (config.merge.maxIterations <= 0) {
        throw std::invalid_argument("GameConfig: maxIterations must be positive");
    }
    if (config.merge.mergeDelay < 0.0 || config.merge.comboWindow < 0.0) {
        throw std::invalid_argument("GameConfig: merge timings must not be negative");
    }

    const auto& p = config.powerUps;
    if (p.spawnChance < 0.0 || p.spawnChance > 1.0) {
        throw std::invalid_argument("GameConfig: spawnChance must be in [0, 1]");
    }
    if (p.slowDownMultiplier <= 0.0 || p.duration < 0.0) {
        throw std::invalid_argument("GameConfig: power-up timings are invalid");
    }
}

} // namespace mergetris::core

#include "core/LevelManager.hpp"
#include <algorithm>

namespace mergetris::core {

LevelManager::LevelManager(const ScoringConfig& config)
    : config_{config}
    , level_{config.startingLevel}
{
}

bool LevelManager::onLinesCleared(int lines) {
    if (lines <= 0) return false;

    linesTowardNext_ += lines;
    totalLinesCleared_ += static_cast<std::uint64_t>(lines);

    if (linesTowardNext_ >= config_.linesPerLevel && level_ < config_.maxLevel) {
        linesTowardNext_ -= config_.linesPerLevel;
        level_ = std::min(level_ + 1, config_.maxLevel);
        return true;
    }
    return false;
}

void LevelManager::reset() {
    level_ = config_.startingLevel;
    linesTowardNext_ = 0;
    totalLinesCleared_ = 0;
}

double LevelManager::dropInterval() const noexcept {
    return dropInterval(level_, config_);
}

double LevelManager::dropInterval(int level, const ScoringConfig& config) noexcept {
    // Linear speed-up per level, clamped at the minimum interval.
    const double interval = config.baseInterval - (level - 1) * config.levelSpeedStep;
    return std::max(config.minInterval, interval);
}

} // namespace mergetris::core

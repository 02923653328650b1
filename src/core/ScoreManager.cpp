#include "core/ScoreManager.hpp"

#include <algorithm>
#include <cmath>

namespace mergetris::core {

ScoreManager::ScoreManager(const ScoringConfig& config)
    : config_{config}
    , levels_{config}
{
}

void ScoreManager::addScore(std::int64_t points, EventList& events) {
    if (points <= 0) return; // score never decreases

    score_ += static_cast<std::uint64_t>(points);
    events.emplace_back(ScoreChanged{score_});

    if (score_ > highScore_) {
        highScore_ = score_;
        events.emplace_back(HighScoreChanged{highScore_});
    }
}

std::int64_t ScoreManager::addRowClearScore(int rowsCleared, int combo, EventList& events) {
    if (rowsCleared <= 0) return 0;

    const std::int64_t rowScore = rowClearScore(rowsCleared, combo, levels_.level(), config_);
    addScore(rowScore, events);

    const bool leveledUp = levels_.onLinesCleared(rowsCleared);
    events.emplace_back(LinesClearedChanged{static_cast<int>(levels_.totalLinesCleared())});

    if (leveledUp) {
        events.emplace_back(LevelChanged{levels_.level()});
        addScore(config_.scorePerLevel, events);
    }

    return rowScore;
}

void ScoreManager::loadHighScore(std::uint64_t highScore) noexcept {
    highScore_ = std::max(highScore_, highScore);
}

void ScoreManager::reset() noexcept {
    score_ = 0;
    levels_.reset();
}

std::int64_t ScoreManager::mergeScore(CellValue newValue, int combo) noexcept {
    const double comboMultiplier = 1.0 + combo * 0.5;
    return std::lround(static_cast<double>(newValue) * comboMultiplier);
}

std::int64_t ScoreManager::rowClearScore(int rowsCleared, int combo, int level,
                                         const ScoringConfig& config) noexcept {
    if (rowsCleared <= 0) return 0;

    const std::size_t idx = static_cast<std::size_t>(std::min(rowsCleared, 4) - 1);
    const double rowMultiplier = config.rowMultipliers[idx];
    const double comboMultiplier = 1.0 + combo * 0.25;
    const double levelMultiplier = 1.0 + (level - 1) * 0.1;

    return std::lround(config.scorePerRow * rowsCleared * rowMultiplier
                       * comboMultiplier * levelMultiplier);
}

} // namespace mergetris::core

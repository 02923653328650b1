#pragma once

#include <cstdint>

#include "core/GameConfig.hpp"

namespace mergetris::core {

class LevelManager {
public:
    explicit LevelManager(const ScoringConfig& config = ScoringConfig{});

    int level() const noexcept { return level_; }
    int linesTowardNextLevel() const noexcept { return linesTowardNext_; }
    std::uint64_t totalLinesCleared() const noexcept { return totalLinesCleared_; }

    // Call after lines are cleared. Returns true when the level went up
    // (at most one level per call).
    bool onLinesCleared(int lines);

    void reset();

    // Seconds between two gravity steps at the current level.
    double dropInterval() const noexcept;

    static double dropInterval(int level, const ScoringConfig& config) noexcept;

private:
    ScoringConfig config_;
    int level_;
    int linesTowardNext_{0};
    std::uint64_t totalLinesCleared_{0};
};

} // namespace mergetris::core

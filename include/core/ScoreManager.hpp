#pragma once

#include <cstdint>

#include "core/GameConfig.hpp"
#include "core/GameEvents.hpp"
#include "core/LevelManager.hpp"

namespace mergetris::core {

// Owns score, high score and level progression. Every change is reported
// through the event list passed in.
class ScoreManager {
public:
    explicit ScoreManager(const ScoringConfig& config = ScoringConfig{});

    void addScore(std::int64_t points, EventList& events);

    // Scores a row clear, then advances lines and level. Returns the row
    // score (level-up bonus excluded).
    std::int64_t addRowClearScore(int rowsCleared, int combo, EventList& events);

    std::uint64_t score() const noexcept { return score_; }
    std::uint64_t highScore() const noexcept { return highScore_; }
    int level() const noexcept { return levels_.level(); }
    const LevelManager& levels() const noexcept { return levels_; }

    double dropInterval() const noexcept { return levels_.dropInterval(); }

    // Seeds the all-time high score (e.g. from storage). Never lowers it.
    void loadHighScore(std::uint64_t highScore) noexcept;

    // New game: score and level progression reset, high score kept.
    void reset() noexcept;

    static std::int64_t mergeScore(CellValue newValue, int combo) noexcept;
    static std::int64_t rowClearScore(int rowsCleared, int combo, int level,
                                      const ScoringConfig& config) noexcept;

private:
    ScoringConfig config_;
    LevelManager levels_;
    std::uint64_t score_{0};
    std::uint64_t highScore_{0};
};

} // namespace mergetris::core

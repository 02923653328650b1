#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace mergetris::core {

struct BoardConfig {
    int width{10};
    int height{20};
};

struct TimingConfig {
    double lockDelay{0.5};           // seconds a blocked piece waits before locking
    double softDropMultiplier{10.0}; // drop interval divisor while soft drop is held
};

struct ScoringConfig {
    int scorePerRow{100};
    int scorePerLevel{1000};
    std::array<double, 4> rowMultipliers{{1.0, 3.0, 5.0, 8.0}}; // 1, 2, 3, 4+ rows

    int startingLevel{1};
    int maxLevel{20};
    int linesPerLevel{10};

    int hardDropPointsPerCell{2};
    int comboBonusPerMerge{50}; // paid when a combo of 2+ times out

    // Drop speed curve, seconds per row
    double baseInterval{1.0};
    double minInterval{0.05};
    double levelSpeedStep{0.05};
};

struct MergeConfig {
    double mergeDelay{0.1};     // pause between merge and gravity steps
    int maxIterations{100};     // cascade safety bound
    double comboWindow{2.0};    // seconds without a merge before the combo ends
};

struct PowerUpConfig {
    double spawnChance{0.1};    // per cleared row
    int minRowsForSpawn{3};
    double duration{5.0};       // Freeze; SlowDown lasts twice as long
    double slowDownMultiplier{0.5};
};

struct GameConfig {
    BoardConfig board;
    TimingConfig timing;
    ScoringConfig scoring;
    MergeConfig merge;
    PowerUpConfig powerUps;

    // Fixed seed for reproducible games; random_device when empty.
    std::optional<std::uint32_t> seed;
};

// Throws std::invalid_argument describing the first bad field.
void validate(const GameConfig& config);

} // namespace mergetris::core

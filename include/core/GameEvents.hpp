#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "core/Types.hpp"

namespace mergetris::core {

enum class PowerUpType : std::uint8_t {
    ClearRow,
    Bomb,
    Freeze,
    SlowDown,
    ColorBomb,
    Shuffle
};

inline constexpr int PowerUpTypeCount = 6;

// ---------- Notifications for the presentation layer ----------

struct ScoreChanged {
    std::uint64_t score{};
};

struct HighScoreChanged {
    std::uint64_t highScore{};
};

struct LevelChanged {
    int level{};
};

struct LinesClearedChanged {
    int totalLines{};
};

struct MergeOccurred {
    Position at{};
    CellValue value{};
    int combo{};
};

struct ComboEnded {
    int combo{};
};

struct RowsCleared {
    int rows{};
    int combo{};
};

struct PieceLocked {
    TetrominoType type{};
};

struct PowerUpCollected {
    PowerUpType type{};
};

struct PowerUpActivated {
    PowerUpType type{};
};

struct PowerUpExpired {
    PowerUpType type{};
};

struct CascadeLimitReached {
    int iterations{};
};

struct GameOver {
    std::uint64_t finalScore{};
};

using GameEvent = std::variant<
    ScoreChanged,
    HighScoreChanged,
    LevelChanged,
    LinesClearedChanged,
    MergeOccurred,
    ComboEnded,
    RowsCleared,
    PieceLocked,
    PowerUpCollected,
    PowerUpActivated,
    PowerUpExpired,
    CascadeLimitReached,
    GameOver
>;

using EventList = std::vector<GameEvent>;

} // namespace mergetris::core

#pragma once

#include <cstdint>

namespace mergetris::core {

// Persistence collaborator for the all-time high score. The storage
// format is up to the implementation.
class IHighScoreStore {
public:
    virtual ~IHighScoreStore() = default;

    /// Returns 0 when nothing has been stored yet.
    virtual std::uint64_t loadHighScore() = 0;

    virtual void saveHighScore(std::uint64_t highScore) = 0;
};

} // namespace mergetris::core

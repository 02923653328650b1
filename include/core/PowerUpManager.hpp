#pragma once

#include <deque>
#include <optional>
#include <random>
#include <vector>

#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/GameEvents.hpp"

namespace mergetris::core {

struct ActiveEffect {
    PowerUpType type{};
    double remaining{}; // seconds
};

const char* toString(PowerUpType type) noexcept;

// Whether activating this kind changes the board (and needs a cascade).
bool isDestructive(PowerUpType type) noexcept;

class PowerUpManager {
public:
    explicit PowerUpManager(const PowerUpConfig& config = PowerUpConfig{});
    PowerUpManager(const PowerUpConfig& config, std::uint32_t seed);

    // Rolls for a new power-up after a row clear. Returns the kind that was
    // queued, if any.
    std::optional<PowerUpType> trySpawn(int rowsCleared, EventList& events);

    void enqueue(PowerUpType type, EventList& events);

    // Pops the oldest queued kind and applies it. Empty optional when the
    // queue is empty.
    std::optional<PowerUpType> activateNext(Board& board, EventList& events);

    void activate(PowerUpType type, Board& board, EventList& events);

    // Counts timed effects down and drops the expired ones.
    void update(double dt, EventList& events);

    bool isActive(PowerUpType type) const noexcept;

    // 0 while frozen, slowDownMultiplier while slowed, 1 otherwise.
    double speedMultiplier() const noexcept;

    std::size_t queuedCount() const noexcept { return queue_.size(); }
    const std::deque<PowerUpType>& queue() const noexcept { return queue_; }
    const std::vector<ActiveEffect>& activeEffects() const noexcept { return active_; }

    void reset() noexcept;

    // Board effects, exposed for tests. Each returns the number of blocks
    // destroyed (Shuffle: blocks whose value was reassigned).
    static int clearLowestRow(Board& board);
    static int bomb(Board& board);
    int colorBomb(Board& board);
    int shuffle(Board& board);

    // Cell the bomb is centred on: the last hit of a top-down scan that
    // stops each row at its leftmost block.
    static std::optional<Position> bombTarget(const Board& board) noexcept;

private:
    PowerUpConfig config_;
    std::mt19937 rng_;

    std::deque<PowerUpType> queue_;
    std::vector<ActiveEffect> active_;

    void addTimedEffect(PowerUpType type, double duration);
};

} // namespace mergetris::core

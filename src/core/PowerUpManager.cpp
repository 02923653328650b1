#include "core/PowerUpManager.hpp"

#include <algorithm>
#include <utility>

namespace mergetris::core {

const char* toString(PowerUpType type) noexcept {
    switch (type) {
    case PowerUpType::ClearRow:  return "Clear Row";
    case PowerUpType::Bomb:      return "Bomb";
    case PowerUpType::Freeze:    return "Freeze";
    case PowerUpType::SlowDown:  return "Slow Down";
    case PowerUpType::ColorBomb: return "Color Bomb";
    case PowerUpType::Shuffle:   return "Shuffle";
    }
    return "Unknown";
}

bool isDestructive(PowerUpType type) noexcept {
    return type != PowerUpType::Freeze && type != PowerUpType::SlowDown;
}

PowerUpManager::PowerUpManager(const PowerUpConfig& config)
    : config_{config}
    , rng_{std::random_device{}()}
{
}

PowerUpManager::PowerUpManager(const PowerUpConfig& config, std::uint32_t seed)
    : config_{config}
    , rng_{seed}
{
}

std::optional<PowerUpType> PowerUpManager::trySpawn(int rowsCleared, EventList& events) {
    if (rowsCleared < config_.minRowsForSpawn) {
        return std::nullopt;
    }

    const double chance = config_.spawnChance * rowsCleared;
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    if (roll(rng_) >= chance) {
        return std::nullopt;
    }

    std::uniform_int_distribution<int> kind(0, PowerUpTypeCount - 1);
    const auto type = static_cast<PowerUpType>(kind(rng_));
    enqueue(type, events);
    return type;
}

void PowerUpManager::enqueue(PowerUpType type, EventList& events) {
    queue_.push_back(type);
    events.emplace_back(PowerUpCollected{type});
}

std::optional<PowerUpType> PowerUpManager::activateNext(Board& board, EventList& events) {
    if (queue_.empty()) {
        return std::nullopt;
    }

    const PowerUpType type = queue_.front();
    queue_.pop_front();
    activate(type, board, events);
    return type;
}

void PowerUpManager::activate(PowerUpType type, Board& board, EventList& events) {
    switch (type) {
    case PowerUpType::ClearRow:
        clearLowestRow(board);
        break;
    case PowerUpType::Bomb:
        bomb(board);
        break;
    case PowerUpType::Freeze:
        addTimedEffect(type, config_.duration);
        break;
    case PowerUpType::SlowDown:
        addTimedEffect(type, config_.duration * 2.0);
        break;
    case PowerUpType::ColorBomb:
        colorBomb(board);
        break;
    case PowerUpType::Shuffle:
        shuffle(board);
        break;
    }

    events.emplace_back(PowerUpActivated{type});
}

void PowerUpManager::addTimedEffect(PowerUpType type, double duration) {
    active_.push_back(ActiveEffect{type, duration});
}

void PowerUpManager::update(double dt, EventList& events) {
    for (auto& effect : active_) {
        effect.remaining -= dt;
    }

    auto expired = std::stable_partition(active_.begin(), active_.end(),
        [](const ActiveEffect& e) { return e.remaining > 0.0; });

    for (auto it = expired; it != active_.end(); ++it) {
        events.emplace_back(PowerUpExpired{it->type});
    }
    active_.erase(expired, active_.end());
}

bool PowerUpManager::isActive(PowerUpType type) const noexcept {
    return std::any_of(active_.begin(), active_.end(),
        [type](const ActiveEffect& e) { return e.type == type; });
}

double PowerUpManager::speedMultiplier() const noexcept {
    if (isActive(PowerUpType::Freeze)) return 0.0;
    if (isActive(PowerUpType::SlowDown)) return config_.slowDownMultiplier;
    return 1.0;
}

void PowerUpManager::reset() noexcept {
    queue_.clear();
    active_.clear();
}

int PowerUpManager::clearLowestRow(Board& board) {
    const auto row = board.lowestNonEmptyRow();
    if (!row) return 0;
    return board.clearRow(*row);
}

std::optional<Position> PowerUpManager::bombTarget(const Board& board) noexcept {
    std::optional<Position> target;
    for (int y = board.height() - 1; y >= 0; --y) {
        for (int x = 0; x < board.width(); ++x) {
            if (!board.isEmpty(x, y)) {
                target = Position{x, y};
                break;
            }
        }
    }
    return target;
}

int PowerUpManager::bomb(Board& board) {
    const auto center = bombTarget(board);
    if (!center) return 0;

    int destroyed = 0;
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            const int x = center->x + dx;
            const int y = center->y + dy;
            if (board.get(x, y)) {
                board.remove(x, y);
                ++destroyed;
            }
        }
    }
    return destroyed;
}

int PowerUpManager::colorBomb(Board& board) {
    const auto cells = board.occupiedPositions();
    if (cells.empty()) return 0;

    std::uniform_int_distribution<std::size_t> pick(0, cells.size() - 1);
    const Position chosen = cells[pick(rng_)];
    const CellValue target = board.get(chosen.x, chosen.y)->value;

    int destroyed = 0;
    for (const auto& p : cells) {
        if (board.get(p.x, p.y)->value == target) {
            board.remove(p.x, p.y);
            ++destroyed;
        }
    }
    return destroyed;
}

int PowerUpManager::shuffle(Board& board) {
    const auto cells = board.occupiedPositions();
    if (cells.size() < 2) return 0;

    std::vector<CellValue> values;
    values.reserve(cells.size());
    for (const auto& p : cells) {
        values.push_back(board.get(p.x, p.y)->value);
    }

    // Fisher-Yates, back to front
    for (std::size_t i = values.size() - 1; i > 0; --i) {
        std::uniform_int_distribution<std::size_t> pick(0, i);
        std::swap(values[i], values[pick(rng_)]);
    }

    for (std::size_t i = 0; i < cells.size(); ++i) {
        board.setValue(cells[i].x, cells[i].y, values[i]);
    }
    return static_cast<int>(cells.size());
}

} // namespace mergetris::core

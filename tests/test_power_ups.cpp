#include <catch2/catch.hpp>

#include <algorithm>
#include <variant>
#include <vector>

#include "core/Board.hpp"
#include "core/PowerUpManager.hpp"

using namespace mergetris::core;

namespace {

PowerUpConfig alwaysSpawn() {
    PowerUpConfig cfg;
    cfg.spawnChance = 1.0;
    return cfg;
}

std::vector<CellValue> sortedValues(const Board& board) {
    std::vector<CellValue> values;
    for (const auto& p : board.occupiedPositions()) {
        values.push_back(board.get(p.x, p.y)->value);
    }
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace

TEST_CASE("Power-ups spawn only after big row clears", "[powerup]") {
    PowerUpManager pm{alwaysSpawn(), 7U};
    EventList events;

    CHECK_FALSE(pm.trySpawn(1, events).has_value());
    CHECK_FALSE(pm.trySpawn(2, events).has_value());
    CHECK(events.empty());

    const auto spawned = pm.trySpawn(3, events);
    REQUIRE(spawned.has_value());
    CHECK(pm.queuedCount() == 1);
    CHECK(pm.queue().front() == *spawned);

    REQUIRE(events.size() == 1);
    CHECK(std::get<PowerUpCollected>(events.front()).type == *spawned);
}

TEST_CASE("Power-ups never spawn with zero chance", "[powerup]") {
    PowerUpConfig cfg;
    cfg.spawnChance = 0.0;
    PowerUpManager pm{cfg, 7U};
    EventList events;

    for (int i = 0; i < 100; ++i) {
        CHECK_FALSE(pm.trySpawn(4, events).has_value());
    }
    CHECK(pm.queuedCount() == 0);
}

TEST_CASE("Activation is FIFO and refused on an empty queue", "[powerup]") {
    PowerUpManager pm{PowerUpConfig{}, 1U};
    Board board{10, 20};
    EventList events;

    CHECK_FALSE(pm.activateNext(board, events).has_value());

    pm.enqueue(PowerUpType::Freeze, events);
    pm.enqueue(PowerUpType::SlowDown, events);

    const auto first = pm.activateNext(board, events);
    REQUIRE(first.has_value());
    CHECK(*first == PowerUpType::Freeze);
    CHECK(pm.queuedCount() == 1);
    CHECK(std::holds_alternative<PowerUpActivated>(events.back()));
}

TEST_CASE("Freeze and SlowDown change the speed until they expire", "[powerup][timed]") {
    PowerUpManager pm{PowerUpConfig{}, 1U};
    Board board{10, 20};
    EventList events;

    CHECK(pm.speedMultiplier() == 1.0);

    pm.activate(PowerUpType::SlowDown, board, events);
    CHECK(pm.speedMultiplier() == 0.5);

    pm.activate(PowerUpType::Freeze, board, events);
    CHECK(pm.speedMultiplier() == 0.0); // freeze wins
    CHECK(pm.activeEffects().size() == 2);

    events.clear();
    pm.update(4.0, events);
    CHECK(pm.isActive(PowerUpType::Freeze));
    CHECK(events.empty());

    pm.update(1.0, events);
    CHECK_FALSE(pm.isActive(PowerUpType::Freeze));
    CHECK(pm.isActive(PowerUpType::SlowDown));
    CHECK(pm.speedMultiplier() == 0.5);
    REQUIRE(events.size() == 1);
    CHECK(std::get<PowerUpExpired>(events.front()).type == PowerUpType::Freeze);

    pm.update(5.0, events);
    CHECK(pm.activeEffects().empty());
    CHECK(pm.speedMultiplier() == 1.0);
}

TEST_CASE("ClearRow destroys the lowest non-empty row", "[powerup][board]") {
    Board board{4, 6};
    REQUIRE(board.place(Block{2}, 0, 1));
    REQUIRE(board.place(Block{4}, 3, 1));
    REQUIRE(board.place(Block{8}, 1, 2));

    CHECK(PowerUpManager::clearLowestRow(board) == 2);
    CHECK(board.occupiedCount() == 1);
    CHECK(board.get(1, 2)->value == 8); // no shift

    Board empty{4, 6};
    CHECK(PowerUpManager::clearLowestRow(empty) == 0);
}

TEST_CASE("Bomb clears the 3x3 around the leftmost block of the lowest row", "[powerup][board]") {
    Board board{10, 20};
    REQUIRE(board.place(Block{2}, 2, 0));
    REQUIRE(board.place(Block{2}, 5, 0));
    REQUIRE(board.place(Block{4}, 3, 1));
    REQUIRE(board.place(Block{8}, 1, 3));

    const auto target = PowerUpManager::bombTarget(board);
    REQUIRE(target.has_value());
    CHECK(*target == Position{2, 0});

    CHECK(PowerUpManager::bomb(board) == 2);
    CHECK(board.isEmpty(2, 0));
    CHECK(board.isEmpty(3, 1));
    CHECK_FALSE(board.isEmpty(5, 0));
    CHECK_FALSE(board.isEmpty(1, 3));

    Board empty{10, 20};
    CHECK_FALSE(PowerUpManager::bombTarget(empty).has_value());
    CHECK(PowerUpManager::bomb(empty) == 0);
}

TEST_CASE("ColorBomb removes every block of one value", "[powerup][board]") {
    PowerUpManager pm{PowerUpConfig{}, 99U};
    Board board{10, 20};
    REQUIRE(board.place(Block{2}, 0, 0));
    REQUIRE(board.place(Block{4}, 1, 0));
    REQUIRE(board.place(Block{2}, 2, 0));
    REQUIRE(board.place(Block{4}, 3, 0));
    REQUIRE(board.place(Block{2}, 4, 0));

    const int destroyed = pm.colorBomb(board);
    REQUIRE((destroyed == 3 || destroyed == 2));

    const auto remaining = sortedValues(board);
    REQUIRE(remaining.size() == static_cast<std::size_t>(5 - destroyed));
    const CellValue survivor = destroyed == 3 ? 4U : 2U;
    for (auto v : remaining) {
        CHECK(v == survivor);
    }
}

TEST_CASE("Shuffle keeps positions and the value multiset", "[powerup][board]") {
    PowerUpManager pm{PowerUpConfig{}, 5U};
    Board board{10, 20};
    const CellValue values[] = {2, 4, 8, 16, 32, 64};
    for (int i = 0; i < 6; ++i) {
        REQUIRE(board.place(Block{values[i]}, i, i % 2));
    }
    const auto before = board.occupiedPositions();
    const auto valuesBefore = sortedValues(board);

    CHECK(pm.shuffle(board) == 6);

    CHECK(board.occupiedPositions() == before);
    CHECK(sortedValues(board) == valuesBefore);

    Board single{4, 4};
    REQUIRE(single.place(Block{2}, 0, 0));
    CHECK(pm.shuffle(single) == 0);
}

TEST_CASE("Only board-changing kinds need a cascade", "[powerup]") {
    CHECK(isDestructive(PowerUpType::ClearRow));
    CHECK(isDestructive(PowerUpType::Bomb));
    CHECK(isDestructive(PowerUpType::ColorBomb));
    CHECK(isDestructive(PowerUpType::Shuffle));
    CHECK_FALSE(isDestructive(PowerUpType::Freeze));
    CHECK_FALSE(isDestructive(PowerUpType::SlowDown));
}

#include <catch2/catch.hpp>

#include <variant>

#include "core/ComboTracker.hpp"
#include "core/GameConfig.hpp"
#include "core/LevelManager.hpp"
#include "core/ScoreManager.hpp"

using namespace mergetris::core;
using Catch::Matchers::WithinAbs;

namespace {

template <typename Event>
int countEvents(const EventList& events) {
    int n = 0;
    for (const auto& e : events) {
        if (std::holds_alternative<Event>(e)) ++n;
    }
    return n;
}

} // namespace

TEST_CASE("Merge score grows with the combo", "[score]") {
    CHECK(ScoreManager::mergeScore(8, 1) == 12);
    CHECK(ScoreManager::mergeScore(4, 1) == 6);
    CHECK(ScoreManager::mergeScore(8, 2) == 16);
    CHECK(ScoreManager::mergeScore(4, 0) == 4);
    CHECK(ScoreManager::mergeScore(2, 3) == 5); // 2 * 2.5
}

TEST_CASE("Row clear score follows rows, combo and level", "[score]") {
    const ScoringConfig cfg;

    CHECK(ScoreManager::rowClearScore(1, 0, 1, cfg) == 100);
    CHECK(ScoreManager::rowClearScore(2, 0, 1, cfg) == 600);
    CHECK(ScoreManager::rowClearScore(3, 0, 1, cfg) == 1500);
    CHECK(ScoreManager::rowClearScore(4, 0, 1, cfg) == 3200);
    // More than four rows reuse the four-row multiplier
    CHECK(ScoreManager::rowClearScore(5, 0, 1, cfg) == 4000);

    CHECK(ScoreManager::rowClearScore(1, 2, 1, cfg) == 150);
    CHECK(ScoreManager::rowClearScore(1, 0, 3, cfg) == 120);
    CHECK(ScoreManager::rowClearScore(0, 5, 5, cfg) == 0);
}

TEST_CASE("Score never decreases and updates the high score", "[score]") {
    ScoreManager sm;
    EventList events;

    sm.addScore(100, events);
    sm.addScore(0, events);
    sm.addScore(-50, events);
    CHECK(sm.score() == 100);
    CHECK(sm.highScore() == 100);
    CHECK(countEvents<ScoreChanged>(events) == 1);
    CHECK(countEvents<HighScoreChanged>(events) == 1);

    sm.reset();
    CHECK(sm.score() == 0);
    CHECK(sm.highScore() == 100);

    events.clear();
    sm.addScore(60, events);
    CHECK(countEvents<HighScoreChanged>(events) == 0);
    sm.addScore(60, events);
    CHECK(sm.highScore() == 120);
    CHECK(countEvents<HighScoreChanged>(events) == 1);
}

TEST_CASE("Loaded high score never goes down", "[score]") {
    ScoreManager sm;
    sm.loadHighScore(500);
    sm.loadHighScore(200);
    CHECK(sm.highScore() == 500);
}

TEST_CASE("Row clears advance lines and level", "[score][level]") {
    ScoreManager sm;
    EventList events;

    for (int i = 0; i < 9; ++i) {
        sm.addRowClearScore(1, 0, events);
    }
    CHECK(sm.level() == 1);
    CHECK(sm.score() == 900);

    events.clear();
    sm.addRowClearScore(1, 0, events);
    CHECK(sm.level() == 2);
    CHECK(sm.levels().linesTowardNextLevel() == 0);
    CHECK(sm.levels().totalLinesCleared() == 10);
    // 100 for the row (scored at level 1) + 1000 level bonus
    CHECK(sm.score() == 2000);

    REQUIRE(countEvents<LevelChanged>(events) == 1);
    REQUIRE(countEvents<LinesClearedChanged>(events) == 1);
}

TEST_CASE("Level goes up at most once per clear and stops at the maximum", "[score][level]") {
    ScoringConfig cfg;
    cfg.linesPerLevel = 2;
    cfg.maxLevel = 3;
    LevelManager lm{cfg};

    CHECK(lm.onLinesCleared(4));
    CHECK(lm.level() == 2);
    CHECK(lm.linesTowardNextLevel() == 2);

    CHECK(lm.onLinesCleared(1));
    CHECK(lm.level() == 3);

    CHECK_FALSE(lm.onLinesCleared(4));
    CHECK(lm.level() == 3);
    CHECK(lm.totalLinesCleared() == 9);

    lm.reset();
    CHECK(lm.level() == 1);
    CHECK(lm.totalLinesCleared() == 0);
}

TEST_CASE("Drop interval shrinks per level down to the minimum", "[score][level]") {
    const ScoringConfig cfg;

    CHECK_THAT(LevelManager::dropInterval(1, cfg), WithinAbs(1.0, 1e-9));
    CHECK_THAT(LevelManager::dropInterval(2, cfg), WithinAbs(0.95, 1e-9));
    CHECK_THAT(LevelManager::dropInterval(11, cfg), WithinAbs(0.5, 1e-9));
    CHECK_THAT(LevelManager::dropInterval(20, cfg), WithinAbs(0.05, 1e-9));
    CHECK_THAT(LevelManager::dropInterval(40, cfg), WithinAbs(0.05, 1e-9));
}

TEST_CASE("Starting level is honoured and restored on reset", "[score][level]") {
    ScoringConfig cfg;
    cfg.startingLevel = 5;
    ScoreManager sm{cfg};
    CHECK(sm.level() == 5);
    CHECK_THAT(sm.dropInterval(), WithinAbs(0.8, 1e-9));

    EventList events;
    for (int i = 0; i < 10; ++i) sm.addRowClearScore(1, 0, events);
    CHECK(sm.level() == 6);

    sm.reset();
    CHECK(sm.level() == 5);
}

TEST_CASE("Combo pays a bonus when it times out", "[score][combo]") {
    ScoreManager sm;
    ComboTracker combo{2.0, 50};
    EventList events;

    CHECK(combo.registerMerge(0.0) == 1);
    CHECK(combo.registerMerge(1.0) == 2);
    CHECK(combo.registerMerge(2.5) == 3);

    // Still inside the window
    CHECK_FALSE(combo.update(4.5, sm, events));
    CHECK(combo.combo() == 3);

    CHECK(combo.update(4.6, sm, events));
    CHECK(combo.combo() == 0);
    CHECK(sm.score() == 150);

    REQUIRE(countEvents<ComboEnded>(events) == 1);
    CHECK(std::get<ComboEnded>(events.front()).combo == 3);
}

TEST_CASE("A single merge ends without a bonus", "[score][combo]") {
    ScoreManager sm;
    ComboTracker combo;
    EventList events;

    combo.registerMerge(0.0);
    CHECK(combo.update(3.0, sm, events));
    CHECK(combo.combo() == 0);
    CHECK(sm.score() == 0);
    CHECK(events.empty());
}

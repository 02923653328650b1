#include <catch2/catch.hpp>

#include <stdexcept>
#include <variant>

#include "core/Board.hpp"
#include "core/ComboTracker.hpp"
#include "core/MergeEngine.hpp"
#include "core/ScoreManager.hpp"

using namespace mergetris::core;

namespace {

// Owns everything a cascade touches.
struct CascadeFixture {
    Board board{10, 20};
    ComboTracker combo{};
    ScoreManager score{};
    EventList events;

    CascadeContext context(double now = 0.0) {
        return CascadeContext{board, combo, score, events, now};
    }

    template <typename Event>
    int count() const {
        int n = 0;
        for (const auto& e : events) {
            if (std::holds_alternative<Event>(e)) ++n;
        }
        return n;
    }
};

void buildVerticalChain(Board& board) {
    REQUIRE(board.place(Block{2}, 0, 0));
    REQUIRE(board.place(Block{2}, 0, 1));
    REQUIRE(board.place(Block{4}, 0, 2));
}

} // namespace

TEST_CASE("Simple horizontal merge doubles the left block", "[merge]") {
    CascadeFixture f;
    REQUIRE(f.board.place(Block{4}, 3, 0));
    REQUIRE(f.board.place(Block{4}, 4, 0));

    MergeEngine engine;
    auto ctx = f.context();
    const auto result = engine.resolve(ctx);

    REQUIRE(f.board.get(3, 0).has_value());
    CHECK(f.board.get(3, 0)->value == 8);
    CHECK(f.board.isEmpty(4, 0));
    CHECK(f.combo.combo() == 1);
    CHECK(f.score.score() == 12); // round(8 * 1.5)

    CHECK(result.merges == 1);
    CHECK(result.passes == 1);
    CHECK(result.rowsCleared == 0);
    CHECK_FALSE(engine.isRunning());

    REQUIRE(f.count<MergeOccurred>() == 1);
    const auto& merged = std::get<MergeOccurred>(f.events.front());
    CHECK(merged.at == Position{3, 0});
    CHECK(merged.value == 8);
    CHECK(merged.combo == 1);
}

TEST_CASE("Pair search prefers the right neighbour and uses each block once", "[merge]") {
    Board board{4, 4};
    REQUIRE(board.place(Block{2}, 0, 0));
    REQUIRE(board.place(Block{2}, 1, 0));
    REQUIRE(board.place(Block{2}, 0, 1));
    REQUIRE(board.place(Block{2}, 2, 0));

    const auto pairs = MergeEngine::findMergePairs(board);

    // (0,0)+(1,0) first; (2,0) has no free partner left; (0,1) neither
    REQUIRE(pairs.size() == 1);
    CHECK(pairs[0].first == Position{0, 0});
    CHECK(pairs[0].second == Position{1, 0});
}

TEST_CASE("Pair search ignores unlocked blocks", "[merge]") {
    Board board{4, 4};
    REQUIRE(board.place(Block{2, {}, false}, 0, 0));
    REQUIRE(board.place(Block{2}, 1, 0));

    CHECK(MergeEngine::findMergePairs(board).empty());
}

TEST_CASE("Cascade repeats merge and gravity until nothing pairs", "[merge][cascade]") {
    CascadeFixture f;
    buildVerticalChain(f.board);

    MergeEngine engine;
    auto ctx = f.context();
    const auto result = engine.resolve(ctx);

    CHECK(result.passes == 2);
    CHECK(result.merges == 2);
    CHECK(f.board.get(0, 0)->value == 8);
    CHECK(f.board.occupiedCount() == 1);
    CHECK(f.combo.combo() == 2);
    CHECK(f.score.score() == 6 + 16); // round(4*1.5) + round(8*2.0)
}

TEST_CASE("Cascade is deterministic for a given board", "[merge][cascade]") {
    auto build = [](Board& b) {
        const CellValue values[] = {2, 2, 4, 8, 8, 4, 2, 4, 4, 2};
        for (int x = 0; x < 10; ++x) {
            REQUIRE(b.place(Block{values[x]}, x, 0));
            REQUIRE(b.place(Block{values[9 - x]}, x, 1));
        }
        REQUIRE(b.place(Block{16}, 3, 2));
    };

    CascadeFixture a;
    CascadeFixture b;
    build(a.board);
    build(b.board);

    MergeEngine engineA;
    MergeEngine engineB;
    auto ctxA = a.context();
    auto ctxB = b.context();
    const auto ra = engineA.resolve(ctxA);
    const auto rb = engineB.resolve(ctxB);

    CHECK(ra.merges == rb.merges);
    CHECK(ra.rowsCleared == rb.rowsCleared);
    CHECK(a.score.score() == b.score.score());
    for (int y = 0; y < 20; ++y) {
        for (int x = 0; x < 10; ++x) {
            const auto ca = a.board.get(x, y);
            const auto cb = b.board.get(x, y);
            REQUIRE(ca.has_value() == cb.has_value());
            if (ca) {
                REQUIRE(ca->value == cb->value);
            }
        }
    }

    // Fixed point: nothing left to merge
    CHECK(MergeEngine::findMergePairs(a.board).empty());
}

TEST_CASE("Cascade clears full rows after merging", "[merge][rows]") {
    CascadeFixture f;

    // No equal neighbours in any direction
    for (int x = 0; x < 10; ++x) {
        REQUIRE(f.board.place(Block{x % 2 == 0 ? 2U : 4U}, x, 0));
        REQUIRE(f.board.place(Block{x % 2 == 0 ? 8U : 16U}, x, 1));
    }
    REQUIRE(f.board.place(Block{32}, 0, 2));

    MergeEngine engine;
    auto ctx = f.context();
    const auto result = engine.resolve(ctx);

    CHECK(result.merges == 0);
    CHECK(result.rowsCleared == 2);
    CHECK(f.board.occupiedCount() == 1);
    CHECK(f.board.get(0, 0)->value == 32);

    // 100 * 2 rows * 3 at combo 0, level 1
    CHECK(f.score.score() == 600);
    CHECK(f.score.levels().totalLinesCleared() == 2);

    REQUIRE(f.count<RowsCleared>() == 1);
    REQUIRE(f.count<LinesClearedChanged>() == 1);
}

TEST_CASE("Cascade stops at the iteration limit and still clears rows", "[merge][cascade]") {
    CascadeFixture f;
    buildVerticalChain(f.board);

    MergeConfig config;
    config.maxIterations = 1;
    MergeEngine engine{config};

    auto ctx = f.context();
    const auto result = engine.resolve(ctx);

    CHECK(result.hitIterationLimit);
    CHECK(result.merges == 1);
    CHECK(f.board.get(0, 0)->value == 4);
    CHECK(f.board.get(0, 1)->value == 4); // settled but not merged
    REQUIRE(f.count<CascadeLimitReached>() == 1);
    CHECK(std::get<CascadeLimitReached>(f.events.back()).iterations == 1);
    CHECK_FALSE(engine.isRunning());
}

TEST_CASE("Paced cascade waits mergeDelay between steps", "[merge][cascade]") {
    CascadeFixture f;
    REQUIRE(f.board.place(Block{4}, 3, 0));
    REQUIRE(f.board.place(Block{4}, 4, 0));

    MergeConfig config;
    config.mergeDelay = 0.1;
    MergeEngine engine{config};
    engine.begin();
    REQUIRE(engine.isRunning());

    auto ctx = f.context();

    // First scan runs at once
    CHECK_FALSE(engine.update(0.0, ctx).has_value());
    CHECK(f.board.get(3, 0)->value == 8);
    CHECK(engine.isRunning());

    // Not due yet
    CHECK_FALSE(engine.update(0.05, ctx).has_value());

    // Gravity, then the final scan
    CHECK_FALSE(engine.update(0.05, ctx).has_value());
    const auto result = engine.update(0.1, ctx);
    REQUIRE(result.has_value());
    CHECK(result->merges == 1);
    CHECK_FALSE(engine.isRunning());
}

TEST_CASE("Settle-first cascade closes holes before scanning", "[merge][cascade]") {
    CascadeFixture f;
    REQUIRE(f.board.place(Block{8}, 5, 0));
    REQUIRE(f.board.place(Block{8}, 5, 3)); // floating after a bomb

    MergeEngine engine;
    auto ctx = f.context();
    const auto result = engine.resolve(ctx, /*settleFirst=*/true);

    CHECK(result.merges == 1);
    CHECK(f.board.get(5, 0)->value == 16);
    CHECK(f.board.occupiedCount() == 1);
}

TEST_CASE("executeMerge rejects a stale pair", "[merge]") {
    CascadeFixture f;
    REQUIRE(f.board.place(Block{4}, 0, 0));
    REQUIRE(f.board.place(Block{8}, 1, 0));

    auto ctx = f.context();
    CHECK_THROWS_AS(MergeEngine::executeMerge(MergePair{{0, 0}, {1, 0}}, ctx), std::logic_error);
    CHECK_THROWS_AS(MergeEngine::executeMerge(MergePair{{0, 0}, {0, 1}}, ctx), std::logic_error);
}

TEST_CASE("MergeEngine rejects a non-positive iteration limit", "[merge]") {
    MergeConfig config;
    config.maxIterations = 0;
    CHECK_THROWS_AS(MergeEngine{config}, std::invalid_argument);
}

#pragma once

#include <optional>
#include <vector>

#include "core/Board.hpp"
#include "core/ComboTracker.hpp"
#include "core/GameConfig.hpp"
#include "core/GameEvents.hpp"
#include "core/ScoreManager.hpp"

namespace mergetris::core {

// `first` keeps the doubled value, `second` is removed.
struct MergePair {
    Position first{};
    Position second{};
};

struct CascadeResult {
    int passes{0};       // scans that found at least one pair
    int merges{0};
    int rowsCleared{0};
    int comboAtClear{0};
    bool hitIterationLimit{false};
};

// Everything a cascade step reads or mutates, owned by the caller.
struct CascadeContext {
    Board& board;
    ComboTracker& combo;
    ScoreManager& score;
    EventList& events;
    double now; // simulation clock, seconds
};

// Repeats merge + gravity passes until no pair is left, then clears full
// rows. Passes are separated by MergeConfig::mergeDelay when driven by
// update(); resolve() runs the whole cascade at once.
class MergeEngine {
public:
    explicit MergeEngine(const MergeConfig& config = MergeConfig{});

    // Row-major scan from the bottom-left; right neighbour is preferred
    // over the top one and each block appears in at most one pair.
    static std::vector<MergePair> findMergePairs(const Board& board);

    // Doubles pair.first, removes pair.second, bumps the combo and scores
    // the merge. Returns the new value.
    static CellValue executeMerge(const MergePair& pair, CascadeContext& ctx);

    // Starts a cascade. With settleFirst the first step is a gravity pass
    // (used after power-ups that punch holes in the stack).
    void begin(bool settleFirst = false) noexcept;

    bool isRunning() const noexcept { return phase_ != Phase::Idle; }
    int iterations() const noexcept { return iterations_; }

    // Advances the pacing timer by dt and runs every step that is due.
    // Returns the result on the call that finishes the cascade.
    std::optional<CascadeResult> update(double dt, CascadeContext& ctx);

    // Runs a complete cascade synchronously.
    CascadeResult resolve(CascadeContext& ctx, bool settleFirst = false);

    void reset() noexcept;

private:
    enum class Phase {
        Idle,
        Scan,
        Settle,
        Finish
    };

    MergeConfig config_;
    Phase phase_{Phase::Idle};
    double timer_{0.0};
    int iterations_{0};
    CascadeResult result_{};

    // Performs the current phase. Returns true when the cascade finished.
    bool step(CascadeContext& ctx);
};

} // namespace mergetris::core

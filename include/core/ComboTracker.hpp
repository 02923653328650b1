#pragma once

#include "core/GameEvents.hpp"
#include "core/ScoreManager.hpp"

namespace mergetris::core {

// Counts merges that happen within a rolling time window. Times are in
// seconds on the simulation clock.
class ComboTracker {
public:
    explicit ComboTracker(double window = 2.0, int bonusPerMerge = 50);

    int combo() const noexcept { return combo_; }
    double lastMergeTime() const noexcept { return lastMergeTime_; }
    double window() const noexcept { return window_; }

    // Registers a merge at time `now`; returns the new combo count.
    int registerMerge(double now) noexcept;

    // Ends the combo when no merge happened within the window. A combo of
    // two or more pays combo * bonusPerMerge. Returns true if it ended.
    bool update(double now, ScoreManager& score, EventList& events);

    void reset() noexcept;

private:
    double window_;
    int bonusPerMerge_;
    int combo_{0};
    double lastMergeTime_{0.0};
};

} // namespace mergetris::core

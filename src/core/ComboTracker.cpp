#include "core/ComboTracker.hpp"

namespace mergetris::core {

ComboTracker::ComboTracker(double window, int bonusPerMerge)
    : window_{window}
    , bonusPerMerge_{bonusPerMerge}
{
}

int ComboTracker::registerMerge(double now) noexcept {
    ++combo_;
    lastMergeTime_ = now;
    return combo_;
}

bool ComboTracker::update(double now, ScoreManager& score, EventList& events) {
    if (combo_ <= 0 || now - lastMergeTime_ <= window_) {
        return false;
    }

    if (combo_ > 1) {
        events.emplace_back(ComboEnded{combo_});
        score.addScore(static_cast<std::int64_t>(combo_) * bonusPerMerge_, events);
    }

    combo_ = 0;
    return true;
}

void ComboTracker::reset() noexcept {
    combo_ = 0;
    lastMergeTime_ = 0.0;
}

} // namespace mergetris::core

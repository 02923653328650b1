#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include <chrono>

namespace mergetris::controller {

class GameController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    // Length of one simulation step fed to GameState::tick.
    static constexpr Duration Step{10};

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(mergetris::core::GameState& game);

    /// Handle a single discrete player action (e.g. key press).
    /// Returns true when the action changed the game.
    bool handleAction(InputAction action);

    // Called periodically with elapsed wall time since the last call.
    // Time is accumulated and consumed in fixed steps, so the simulation
    // does not depend on the frame rate.
    void update(Duration elapsed);

    // Reset timing accumulator (e.g. when game is reset)
    void resetTiming() noexcept;

    Duration pending() const noexcept { return accumulated_; }

private:
    mergetris::core::GameState& game_;
    Duration accumulated_{0};
};

} // namespace mergetris::controller

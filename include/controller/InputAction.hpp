#pragma once

namespace mergetris::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, gamepad, scripted input, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    SoftDropPressed,
    SoftDropReleased,
    HardDrop,
    RotateCW,
    PauseResume,
    ActivatePowerUp
};

} // namespace mergetris::controller

#include "controller/GameController.hpp"

namespace mergetris::controller {

GameController::GameController(mergetris::core::GameState& game)
    : game_{game}
{
}

bool GameController::handleAction(InputAction action) {
    using core::GameStatus;

    // After game over only an explicit reset() + start() from outside helps.
    if (game_.status() == GameStatus::GameOver ||
        game_.status() == GameStatus::NotStarted) {
        return false;
    }

    switch (action) {
    case InputAction::MoveLeft:
        return game_.moveLeft();
    case InputAction::MoveRight:
        return game_.moveRight();
    case InputAction::SoftDropPressed:
        game_.setSoftDrop(true);
        return true;
    case InputAction::SoftDropReleased:
        game_.setSoftDrop(false);
        return true;
    case InputAction::HardDrop:
        if (game_.status() != GameStatus::Running || !game_.activeTetromino() ||
            game_.isResolving()) {
            return false;
        }
        game_.hardDrop();
        return true;
    case InputAction::RotateCW:
        return game_.rotateClockwise();
    case InputAction::PauseResume:
        if (game_.status() == GameStatus::Running) {
            game_.pause();
            return true;
        }
        if (game_.status() == GameStatus::Paused) {
            game_.resume();
            return true;
        }
        return false;
    case InputAction::ActivatePowerUp:
        return game_.activatePowerUp();
    }
    return false;
}

void GameController::update(Duration elapsed) {
    if (elapsed.count() <= 0) {
        return;
    }

    accumulated_ += elapsed;

    constexpr double stepSeconds = std::chrono::duration<double>(Step).count();

    // If a lot of time passed (lag), we need several steps. Ticks also run
    // while paused so a started cascade can finish.
    while (accumulated_ >= Step) {
        game_.tick(stepSeconds);
        accumulated_ -= Step;
    }
}

void GameController::resetTiming() noexcept {
    accumulated_ = Duration{0};
}

} // namespace mergetris::controller

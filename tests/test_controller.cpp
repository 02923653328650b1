#include <catch2/catch.hpp>

#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"

using mergetris::core::GameConfig;
using mergetris::core::GameState;
using mergetris::core::GameStatus;
using mergetris::core::PowerUpType;
using mergetris::controller::GameController;
using mergetris::controller::InputAction;

namespace {

GameConfig seeded() {
    GameConfig cfg;
    cfg.seed = 21U;
    return cfg;
}

} // namespace

TEST_CASE("GameController ignores actions before the game starts", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};

    CHECK_FALSE(controller.handleAction(InputAction::MoveLeft));
    CHECK_FALSE(controller.handleAction(InputAction::PauseResume));
    CHECK(game.status() == GameStatus::NotStarted);
}

TEST_CASE("GameController maps lateral input actions to GameState movement", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};

    game.start();
    REQUIRE(game.status() == GameStatus::Running);
    REQUIRE(game.activeTetromino().has_value());

    const auto before = game.activeTetromino()->origin();

    // Move left
    CHECK(controller.handleAction(InputAction::MoveLeft));
    const auto afterLeft = game.activeTetromino()->origin();

    REQUIRE(afterLeft.y == before.y);
    REQUIRE(afterLeft.x == before.x - 1);

    // Move right (back to original column)
    CHECK(controller.handleAction(InputAction::MoveRight));
    const auto afterRight = game.activeTetromino()->origin();

    REQUIRE(afterRight.y == before.y);
    REQUIRE(afterRight.x == before.x);
}

TEST_CASE("GameController toggles pause/resume", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};

    game.start();
    REQUIRE(game.status() == GameStatus::Running);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::Paused);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::Running);
}

TEST_CASE("GameController soft drop follows press and release", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};
    game.start();

    controller.handleAction(InputAction::SoftDropPressed);
    CHECK(game.isSoftDropping());

    controller.handleAction(InputAction::SoftDropReleased);
    CHECK_FALSE(game.isSoftDropping());
}

TEST_CASE("GameController forwards hard drop and power-up activation", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};
    game.start();

    CHECK_FALSE(controller.handleAction(InputAction::ActivatePowerUp));
    game.grantPowerUp(PowerUpType::SlowDown);
    CHECK(controller.handleAction(InputAction::ActivatePowerUp));
    CHECK(game.activeEffects().size() == 1);

    CHECK(controller.handleAction(InputAction::HardDrop));
    CHECK(game.lockedPieces() == 1);
}

TEST_CASE("GameController update feeds fixed steps to the game", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};

    game.start();
    REQUIRE(game.activeTetromino().has_value());
    const auto before = game.activeTetromino()->origin();

    // Just over one drop interval of 10 ms steps
    controller.update(GameController::Duration{1050});

    REQUIRE(game.activeTetromino().has_value());
    const auto after = game.activeTetromino()->origin();
    CHECK(after.y == before.y - 1);
    CHECK(after.x == before.x);
    CHECK(controller.pending().count() == 0);

    // Remainders carry over to the next call
    controller.update(GameController::Duration{15});
    CHECK(controller.pending().count() == 5);

    controller.resetTiming();
    CHECK(controller.pending().count() == 0);
}

TEST_CASE("GameController keeps time frozen for a paused game", "[controller]")
{
    GameState game{seeded()};
    GameController controller{game};
    game.start();

    const auto before = game.activeTetromino()->origin();
    controller.handleAction(InputAction::PauseResume);
    controller.update(GameController::Duration{5000});

    CHECK(game.activeTetromino()->origin() == before);
    CHECK(game.elapsed() == 0.0);
}

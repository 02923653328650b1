#pragma once

#include <deque>
#include <string>

#include "gui_sdl/Screen.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/IHighScoreStore.hpp"
#include "controller/GameController.hpp"

namespace mergetris::gui_sdl {

class SinglePlayerScreen final : public Screen {
public:
    /// The store (optional) is not owned; caller keeps it alive.
    explicit SinglePlayerScreen(const core::GameConfig& config = core::GameConfig{},
                                core::IHighScoreStore* highScoreStore = nullptr);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;
    void onFocusLost(Application& app) override;

private:
    // IMPORTANT: declare Layout BEFORE any method that uses it
    struct Layout {
        int cell = 28;

        int boardX = 40;
        int boardY = 40;
        int boardW = 0;
        int boardH = 0;

        int sideX = 0;
        int sideW = 260;
    };

private:
    // Rendering helpers
    void renderBoard(SDL_Renderer* renderer, const Layout& L) const;
    void renderCellValues(const Layout& L) const;
    void renderBoardOverlayText(const Layout& L) const;
    void renderNextPieceWindow(int x, int y, int w) const;
    void renderHUD(Application& app, int x, int y, int w);

    // Input helpers
    void dispatchAction(controller::InputAction action);
    void collectEvents();
    void restart();

    Layout computeLayout(int windowW, int windowH) const;

    // Pixel rectangle of board cell (x, y); y grows upwards on the board.
    SDL_Rect cellRect(const Layout& L, int x, int y, int inset) const;

private:
    core::GameConfig config_;
    core::GameState gameState_;
    controller::GameController controller_;

    // Recent notifications, newest first
    std::deque<std::string> log_;
    static constexpr std::size_t LogSize = 8;

    float fractionalMs_{0.0f};

    // Side movement hold (DAS + ARR)
    float leftHoldSec_{0.0f};
    float rightHoldSec_{0.0f};
    float leftRepeatAccSec_{0.0f};
    float rightRepeatAccSec_{0.0f};

    const float sideDasSec_{0.18f};
    const float sideArrSec_{0.06f};
};

} // namespace mergetris::gui_sdl

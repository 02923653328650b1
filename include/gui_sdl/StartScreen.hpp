#pragma once

#include "gui_sdl/Screen.hpp"
#include "core/GameConfig.hpp"

namespace mergetris::gui_sdl {

// Title menu: picks the starting level and an optional fixed seed, then
// hands a GameConfig to the game screen.
class StartScreen final : public Screen {
public:
    StartScreen() = default;
    explicit StartScreen(const core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    core::GameConfig config_{};

    int startingLevel_{1};
    bool useSeed_{false};
    int seed_{0};

    void startGame(Application& app);
};

} // namespace mergetris::gui_sdl

#include "gui_sdl/StartScreen.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/SinglePlayerScreen.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>

#include <SDL.h>
#include <imgui.h>

namespace mergetris::gui_sdl {

StartScreen::StartScreen(const core::GameConfig& config)
    : config_{config}
    , startingLevel_{config.scoring.startingLevel}
    , useSeed_{config.seed.has_value()}
    , seed_{config.seed ? static_cast<int>(*config.seed) : 0}
{
}

void StartScreen::startGame(Application& app) {
    core::GameConfig config = config_;
    config.scoring.startingLevel = std::clamp(startingLevel_, 1, config.scoring.maxLevel);
    if (useSeed_) {
        config.seed = static_cast<std::uint32_t>(seed_);
    } else {
        config.seed.reset();
    }
    app.setScreen(std::make_unique<SinglePlayerScreen>(config, app.highScoreStore()));
}

void StartScreen::handleEvent(Application& app, const SDL_Event& e) {
    if (e.type != SDL_KEYDOWN || e.key.repeat != 0) return;

    switch (e.key.keysym.sym) {
        case SDLK_RETURN:
        case SDLK_SPACE:
            startGame(app);
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void StartScreen::update(Application&, float) {}

void StartScreen::render(Application& app) {
    const SDL_Point win = app.windowSize();
    const float w = static_cast<float>(win.x);
    const float h = static_cast<float>(win.y);

    const ImVec2 size(360.0f, 0.0f);
    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(size, ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::Begin("Mergetris", nullptr, flags);

    ImGui::TextWrapped("Stack falling pieces. Equal neighbours merge into their sum, "
                       "full rows clear. Press Enter to play.");
    ImGui::Separator();

    if (app.highScoreStore()) {
        ImGui::TextUnformatted("High score is kept between sessions.");
    }

    ImGui::SliderInt("Starting level", &startingLevel_, 1, config_.scoring.maxLevel);
    ImGui::Checkbox("Fixed seed", &useSeed_);
    if (useSeed_) {
        ImGui::InputInt("Seed", &seed_);
        if (seed_ < 0) seed_ = 0;
    }

    ImGui::Spacing();
    if (ImGui::Button("Play", ImVec2(-1, 0))) {
        startGame(app);
    }
    if (ImGui::Button("Quit", ImVec2(-1, 0))) {
        app.requestQuit();
    }

    ImGui::End();
}

} // namespace mergetris::gui_sdl

#pragma once

#include <SDL.h>

namespace mergetris::gui_sdl {

class Application;

// One full-window state of the front end (menu, game). Application owns the
// current screen and calls it once per frame: events, update, render.
class Screen {
public:
    virtual ~Screen() = default;

    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;
    virtual void update(Application& app, float dtSeconds) = 0;

    // Called between ImGui::NewFrame and ImGui::Render.
    virtual void render(Application& app) = 0;

    // The window went to the background.
    virtual void onFocusLost(Application&) {}
};

} // namespace mergetris::gui_sdl

#pragma once

#include <memory>
#include <string>
#include <utility>

#include <SDL.h>

#include "core/IHighScoreStore.hpp"
#include "gui_sdl/Screen.hpp"

namespace mergetris::gui_sdl {

struct WindowSettings {
    std::string title{"Mergetris"};
    int width{900};
    int height{760};

    // Optional TTF for the large board captions; ImGui's default font otherwise.
    std::string captionFont;
    float captionFontSize{32.0f};
};

// Owns the SDL window, the renderer and the ImGui context, and drives one
// Screen at a time.
class Application {
public:
    /// The store (optional) is not owned; caller keeps it alive.
    explicit Application(core::IHighScoreStore* highScoreStore = nullptr);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // False (with the SDL error on stderr) when the window cannot be created.
    bool open(const WindowSettings& settings);

    // Runs frames until a quit is requested. Returns the process exit code.
    int run(std::unique_ptr<Screen> first);

    void requestQuit() noexcept { quitRequested_ = true; }

    // Takes effect before the next frame, so a screen may replace itself
    // from its own handlers.
    void setScreen(std::unique_ptr<Screen> screen) { pending_ = std::move(screen); }

    SDL_Renderer* renderer() const noexcept { return renderer_.get(); }
    SDL_Point windowSize() const;

    core::IHighScoreStore* highScoreStore() const noexcept { return highScoreStore_; }

private:
    struct WindowDeleter {
        void operator()(SDL_Window* w) const noexcept { SDL_DestroyWindow(w); }
    };
    struct RendererDeleter {
        void operator()(SDL_Renderer* r) const noexcept { SDL_DestroyRenderer(r); }
    };

    void loadFonts(const WindowSettings& settings);
    void close();

    void pollEvents();
    float frameDelta();
    void drawFrame();

    core::IHighScoreStore* highScoreStore_;

    bool sdlReady_{false};
    bool imguiReady_{false};
    bool quitRequested_{false};

    std::unique_ptr<SDL_Window, WindowDeleter> window_;
    std::unique_ptr<SDL_Renderer, RendererDeleter> renderer_;

    std::unique_ptr<Screen> screen_;
    std::unique_ptr<Screen> pending_;

    Uint64 lastCounter_{0};
};

} // namespace mergetris::gui_sdl

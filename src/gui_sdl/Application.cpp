#include "gui_sdl/Application.hpp"

#include <cstdio>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace mergetris::gui_sdl {

namespace {

constexpr Uint32 SdlSubsystems = SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS;

// Frames longer than this (window drag, breakpoint) are cut short instead of
// being replayed as a burst of gravity steps.
constexpr float MaxFrameSeconds = 0.25f;

} // namespace

Application::Application(core::IHighScoreStore* highScoreStore)
    : highScoreStore_{highScoreStore}
{
}

Application::~Application() {
    close();
}

bool Application::open(const WindowSettings& settings) {
    if (SDL_Init(SdlSubsystems) != 0) {
        std::fprintf(stderr, "Application: SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }
    sdlReady_ = true;

    window_.reset(SDL_CreateWindow(settings.title.c_str(),
                                   SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                   settings.width, settings.height,
                                   SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE));
    if (!window_) {
        std::fprintf(stderr, "Application: SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    renderer_.reset(SDL_CreateRenderer(window_.get(), -1,
                                       SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC));
    if (!renderer_) {
        std::fprintf(stderr, "Application: SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_SetRenderDrawBlendMode(renderer_.get(), SDL_BLENDMODE_BLEND);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr; // no imgui.ini beside the binary
    loadFonts(settings);

    ImGui_ImplSDL2_InitForSDLRenderer(window_.get(), renderer_.get());
    ImGui_ImplSDLRenderer2_Init(renderer_.get());
    imguiReady_ = true;

    return true;
}

void Application::loadFonts(const WindowSettings& settings) {
    // Fonts[0] body text, Fonts[1] board captions when a TTF was given
    ImGuiIO& io = ImGui::GetIO();
    io.Fonts->AddFontDefault();

    if (settings.captionFont.empty()) return;
    if (!io.Fonts->AddFontFromFileTTF(settings.captionFont.c_str(), settings.captionFontSize)) {
        std::fprintf(stderr, "Application: could not load font %s, using default\n",
                     settings.captionFont.c_str());
    }
}

void Application::close() {
    // A game screen saves its record when destroyed; do it while the store
    // and SDL are still alive.
    pending_.reset();
    screen_.reset();

    if (imguiReady_) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        imguiReady_ = false;
    }

    renderer_.reset();
    window_.reset();

    if (sdlReady_) {
        SDL_Quit();
        sdlReady_ = false;
    }
}

SDL_Point Application::windowSize() const {
    SDL_Point size{0, 0};
    if (window_) {
        SDL_GetWindowSize(window_.get(), &size.x, &size.y);
    }
    return size;
}

void Application::pollEvents() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);

        if (e.type == SDL_QUIT) {
            quitRequested_ = true;
            continue;
        }
        if (!screen_) continue;

        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
            screen_->onFocusLost(*this);
            continue;
        }

        // Keys typed into an ImGui widget belong to the widget
        const bool keyEvent = e.type == SDL_KEYDOWN || e.type == SDL_KEYUP;
        if (keyEvent && ImGui::GetIO().WantTextInput) continue;

        screen_->handleEvent(*this, e);
    }
}

float Application::frameDelta() {
    const Uint64 now = SDL_GetPerformanceCounter();
    const float dt = static_cast<float>(now - lastCounter_) /
                     static_cast<float>(SDL_GetPerformanceFrequency());
    lastCounter_ = now;
    return dt > MaxFrameSeconds ? MaxFrameSeconds : dt;
}

void Application::drawFrame() {
    // SDL drawing first, ImGui on top
    SDL_SetRenderDrawColor(renderer_.get(), 20, 20, 24, 255);
    SDL_RenderClear(renderer_.get());

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    screen_->render(*this);

    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer_.get());
    SDL_RenderPresent(renderer_.get());
}

int Application::run(std::unique_ptr<Screen> first) {
    if (!imguiReady_) {
        std::fprintf(stderr, "Application: run() called before open()\n");
        return 1;
    }

    pending_ = std::move(first);
    lastCounter_ = SDL_GetPerformanceCounter();

    while (!quitRequested_) {
        if (pending_) {
            screen_ = std::move(pending_);
        }
        if (!screen_) break;

        pollEvents();
        if (quitRequested_) break;

        screen_->update(*this, frameDelta());
        drawFrame();
    }

    return 0;
}

} // namespace mergetris::gui_sdl

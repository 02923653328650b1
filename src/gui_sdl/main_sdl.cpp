#include "gui_sdl/Application.hpp"
#include "gui_sdl/StartScreen.hpp"
#include "storage/FileHighScoreStore.hpp"

#include <memory>

int main(int argc, char** argv) {
    mergetris::gui_sdl::WindowSettings settings;
    settings.title = "Mergetris";
    if (argc > 1) {
        settings.captionFont = argv[1];
    }

    // Declared first: screens write the record to it while the app closes
    mergetris::storage::FileHighScoreStore store{"mergetris_highscore.txt"};

    mergetris::gui_sdl::Application app{&store};
    if (!app.open(settings)) {
        return 1;
    }
    return app.run(std::make_unique<mergetris::gui_sdl::StartScreen>());
}

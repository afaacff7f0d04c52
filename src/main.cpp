#include <memory>
#include <string>
#include <utility>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/platform/SDLWindow.h"
#include "../game/ArenaGame.h"
#include "../game/config/ConfigLoader.h"

int main(int argc, char** argv) {
    SDL_SetMainReady();

    const std::string configPath = argc > 1 ? argv[1] : "data/arena.json";
    auto config = Arena::ConfigLoader::loadFromFile(configPath);
    if (!config) {
        Surge::logWarn("Using built-in arena defaults.");
    }

    Arena::ArenaGame game(config ? *config : Arena::ArenaConfig::defaults());
    auto window = std::make_unique<Surge::SDLWindow>();
    Surge::WindowConfig windowConfig{};
    windowConfig.width = static_cast<int>(game.config().playfield.width);
    windowConfig.height = static_cast<int>(game.config().playfield.height);

    Surge::Application app(game, std::move(window), windowConfig);
    if (!app.initialize()) {
        return 1;
    }

    app.run();
    return 0;
}

// Runs the arena without a window for a fixed number of frames and prints the outcome.
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/platform/NullWindow.h"
#include "../game/ArenaGame.h"
#include "../game/config/ConfigLoader.h"

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "data/arena.json";
    const int frames = argc > 2 ? std::max(1, std::atoi(argv[2])) : 60 * 60;
    const unsigned int seed = argc > 3 ? static_cast<unsigned int>(std::strtoul(argv[3], nullptr, 10)) : 1337u;

    auto config = Arena::ConfigLoader::loadFromFile(configPath);
    if (!config) {
        Surge::logWarn("Using built-in arena defaults.");
    }

    Arena::ArenaGame game(config ? *config : Arena::ArenaConfig::defaults(), seed);
    Surge::WindowConfig windowConfig{};
    windowConfig.headless = true;
    windowConfig.title = "PolySurge (headless)";

    {
        Surge::Application app(game, std::make_unique<Surge::NullWindow>(frames), windowConfig);
        if (!app.initialize()) {
            return 1;
        }
        app.run();
    }

    const auto& session = game.session();
    Surge::logInfo("Reached wave " + std::to_string(session.wave()) + ", cleared " +
                   std::to_string(session.wavesCompleted()) + ", kills " + std::to_string(session.kills()) +
                   ", points " + std::to_string(session.points()));
    return 0;
}

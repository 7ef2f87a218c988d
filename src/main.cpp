#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../game/BattleDriver.h"

int main(int argc, char** argv) {
    SDL_SetMainReady();

    std::string dataDir = "data/battle";
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            dataDir = arg;
        }
    }
    if (verbose) Engine::Logger::setMinLevel(Engine::LogLevel::Debug);

    Tactics::BattleDriver driver(dataDir);
    Engine::LoopConfig loop{};
    loop.targetHz = 30.0;

    Engine::Application app(driver, loop);
    if (!app.initialize()) {
        return 1;
    }

    app.run();
    return 0;
}

#include "Application.h"

#include <SDL.h>

#include <algorithm>

#include "Logger.h"

namespace Engine {

Application::Application(ApplicationListener& listener, LoopConfig config)
    : listener_(listener), config_(config) {}

Application::~Application() {
    listener_.onShutdown();
    if (sdlReady_) {
        SDL_Quit();
    }
}

bool Application::initialize() {
    if (SDL_Init(SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdlReady_ = true;

    running_ = listener_.onInitialize(*this);
    return running_;
}

void Application::pollQuitEvents() {
    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        if (ev.type == SDL_QUIT) {
            requestQuit("SDL_QUIT received");
        }
    }
}

void Application::run() {
    const double targetDelta = 1.0 / std::max(1.0, config_.targetHz);
    const double freq = static_cast<double>(SDL_GetPerformanceFrequency());

    Uint64 last = SDL_GetPerformanceCounter();
    while (running_) {
        const Uint64 now = SDL_GetPerformanceCounter();
        const double dt = static_cast<double>(now - last) / freq;
        last = now;

        timeStep_ = advance(timeStep_, std::min(dt, config_.maxDeltaSeconds));

        pollQuitEvents();
        if (!running_) break;
        listener_.onUpdate(timeStep_);

        if (config_.maxRunSeconds > 0.0 && timeStep_.elapsedSeconds >= config_.maxRunSeconds) {
            requestQuit("run time limit reached");
        }

        if (timeStep_.deltaSeconds < targetDelta) {
            SDL_Delay(static_cast<Uint32>((targetDelta - timeStep_.deltaSeconds) * 1000.0));
        }
    }

    logInfo("Application loop exited.");
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Engine

// Headless fixed-rate loop clocked by SDL timers.
#pragma once

#include <string>

#include "ApplicationListener.h"
#include "Time.h"

namespace Engine {

struct LoopConfig {
    double targetHz{60.0};
    // Upper bound on a single delta so a stalled process does not fire every timer at once.
    double maxDeltaSeconds{0.25};
    // 0 keeps running until a quit is requested.
    double maxRunSeconds{0.0};
};

class Application {
public:
    explicit Application(ApplicationListener& listener, LoopConfig config = {});
    ~Application();

    bool initialize();
    void run();
    void requestQuit(const std::string& reason);

    bool running() const { return running_; }
    const LoopConfig& config() const { return config_; }
    const TimeStep& lastStep() const { return timeStep_; }

private:
    void pollQuitEvents();

    ApplicationListener& listener_;
    LoopConfig config_;
    bool sdlReady_{false};
    bool running_{false};
    TimeStep timeStep_{};
};

}  // namespace Engine

// Lifecycle interface driven by the headless application loop.
#pragma once

namespace Engine {

class Application;
struct TimeStep;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    virtual bool onInitialize(Application& app) = 0;
    virtual void onUpdate(const TimeStep& step) = 0;
    virtual void onShutdown() = 0;
};

}  // namespace Engine

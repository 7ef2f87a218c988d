// Headless auto-pilot that plays a battle on the application clock.
#pragma once

#include <memory>
#include <string>

#include "../engine/core/ApplicationListener.h"
#include "battle/BattleSession.h"

namespace Tactics {

class BattleDriver : public Engine::ApplicationListener {
public:
    explicit BattleDriver(std::string dataDir);

    bool onInitialize(Engine::Application& app) override;
    void onUpdate(const Engine::TimeStep& step) override;
    void onShutdown() override;

    const BattleSession* session() const { return session_.get(); }

private:
    // Preview then commit the first playable card; end the turn when nothing is playable.
    void playOneAction();

    std::string dataDir_;
    Engine::Application* app_{nullptr};
    std::unique_ptr<BattleSession> session_;
    bool reported_{false};
};

}  // namespace Tactics

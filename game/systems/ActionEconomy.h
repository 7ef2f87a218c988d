// Per-turn action budget with bonus grants and auto turn-end on exhaustion.
#pragma once

#include "../../engine/core/DeferredTasks.h"
#include "../../engine/core/Signal.h"

namespace Tactics {

struct ActionEconomySettings {
    int baseActionsPerTurn{1};
    bool autoEndTurnWhenExhausted{true};
    double autoEndTurnDelaySeconds{0.5};
};

class ActionEconomy {
public:
    ActionEconomy(Engine::DeferredTaskQueue& tasks, ActionEconomySettings settings = {});

    // Player-turn entry: remaining = max = base + bonus.
    void beginTurn();
    void endTurn();
    // Decrements by one (floor 0); false when nothing was left to spend.
    bool consumeAction();
    // Raises every future turn; mid-turn also raises the current budget.
    void addActionBonus(int amount);
    // Takes effect at the next turn entry.
    void resetActionBonus() { bonus_ = 0; }
    void cancelPendingAutoEnd();
    void reset();

    int remainingActions() const { return remaining_; }
    int maxActionsPerTurn() const { return max_; }
    int actionBonus() const { return bonus_; }
    int baseActionsPerTurn() const { return settings_.baseActionsPerTurn; }
    bool hasActions() const { return remaining_ > 0; }
    bool inTurn() const { return inTurn_; }
    bool autoEndPending() const { return tasks_.isPending(autoEndTask_); }
    const ActionEconomySettings& settings() const { return settings_; }

    Engine::Signal<int, int> actionsChanged;  // remaining, max
    Engine::Signal<> actionsExhausted;
    Engine::Signal<> autoTurnEnd;

private:
    Engine::DeferredTaskQueue& tasks_;
    ActionEconomySettings settings_;
    int remaining_{0};
    int max_{0};
    int bonus_{0};
    bool inTurn_{false};
    Engine::TaskId autoEndTask_{Engine::kInvalidTask};
};

}  // namespace Tactics

#include "ActionEconomy.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"

namespace Tactics {

ActionEconomy::ActionEconomy(Engine::DeferredTaskQueue& tasks, ActionEconomySettings settings)
    : tasks_(tasks), settings_(settings) {
    settings_.baseActionsPerTurn = std::max(1, settings_.baseActionsPerTurn);
    settings_.autoEndTurnDelaySeconds = std::max(0.0, settings_.autoEndTurnDelaySeconds);
}

void ActionEconomy::beginTurn() {
    cancelPendingAutoEnd();
    inTurn_ = true;
    max_ = settings_.baseActionsPerTurn + bonus_;
    remaining_ = max_;
    actionsChanged.emit(remaining_, max_);
}

void ActionEconomy::endTurn() {
    cancelPendingAutoEnd();
    inTurn_ = false;
}

bool ActionEconomy::consumeAction() {
    if (remaining_ <= 0) return false;
    --remaining_;
    actionsChanged.emit(remaining_, max_);
    if (remaining_ > 0) return true;

    Engine::logDebug("Actions exhausted");
    actionsExhausted.emit();
    // The commit that spent the last action has already completed at this point.
    if (settings_.autoEndTurnWhenExhausted && inTurn_ && !autoEndPending()) {
        autoEndTask_ = tasks_.schedule(settings_.autoEndTurnDelaySeconds, [this]() {
            autoEndTask_ = Engine::kInvalidTask;
            if (inTurn_ && remaining_ <= 0) autoTurnEnd.emit();
        });
    }
    return true;
}

void ActionEconomy::addActionBonus(int amount) {
    if (amount <= 0) return;
    bonus_ += amount;
    if (inTurn_) {
        max_ += amount;
        remaining_ += amount;
        cancelPendingAutoEnd();
        actionsChanged.emit(remaining_, max_);
    }
    Engine::logInfo("Action bonus +" + std::to_string(amount) + " (total bonus " + std::to_string(bonus_) + ")");
}

void ActionEconomy::cancelPendingAutoEnd() {
    if (autoEndTask_ != Engine::kInvalidTask) {
        tasks_.cancel(autoEndTask_);
        autoEndTask_ = Engine::kInvalidTask;
    }
}

void ActionEconomy::reset() {
    cancelPendingAutoEnd();
    remaining_ = 0;
    max_ = 0;
    bonus_ = 0;
    inTurn_ = false;
    actionsChanged.emit(remaining_, max_);
}

}  // namespace Tactics

#include "Gate.h"

#include <algorithm>

#include "../../engine/core/Logger.h"

namespace Tactics {

Gate::Gate(int id, const GateTypeConfig& config)
    : id_(id), name_("Gate_" + std::to_string(id)), config_(config), currentHp_(std::max(1, config.baseHp)) {
    config_.baseHp = currentHp_;
    config_.summonInterval = std::max(0, config_.summonInterval);
}

double Gate::hpRatio() const { return static_cast<double>(currentHp_) / static_cast<double>(config_.baseHp); }

int Gate::takeDamage(int amount) {
    if (amount <= 0 || isDestroyed()) return 0;
    const int dealt = std::min(amount, currentHp_);
    currentHp_ -= dealt;
    if (currentHp_ <= 0) {
        onDestroyed();
    }
    return dealt;
}

void Gate::onDestroyed() {
    currentHp_ = 0;
    effectActive_ = false;
    if (config_.destructionBonus > 0) {
        Engine::logInfo(name_ + " destroyed, bonus " + std::to_string(config_.destructionBonus));
    } else {
        Engine::logInfo(name_ + " destroyed");
    }
}

bool Gate::canSummon(int currentTurn) const {
    if (isDestroyed()) return false;
    const int elapsed = currentTurn - lastSummonTurn_;

    // Pattern C's opening burst ignores the interval floor.
    if (config_.pattern == SpawnPattern::PatternC && !firstSummonDone_) return true;
    if (elapsed < config_.summonInterval) return false;

    switch (config_.pattern) {
        case SpawnPattern::PatternA:
            return true;
        case SpawnPattern::PatternB:
            return elapsed >= 3;
        case SpawnPattern::PatternC:
            return elapsed >= 2;
        case SpawnPattern::Periodic:
            return config_.summonInterval > 0 && currentTurn % config_.summonInterval == 0;
        case SpawnPattern::OnDamage:
            return hpRatio() < 0.8;
        case SpawnPattern::Defensive:
            return hpRatio() < 0.5;
        case SpawnPattern::Continuous:
            return true;
    }
    return false;
}

int Gate::spawnCount() const {
    switch (config_.pattern) {
        case SpawnPattern::PatternA:
            return 2;
        case SpawnPattern::PatternB:
            return 3;
        case SpawnPattern::PatternC:
            return firstSummonDone_ ? 1 : 5;
        default:
            return std::max(1, config_.summonCount);
    }
}

void Gate::onSummonExecuted(int currentTurn) {
    lastSummonTurn_ = currentTurn;
    if (config_.pattern == SpawnPattern::PatternC) {
        firstSummonDone_ = true;
    }
}

void Gate::reset() {
    currentHp_ = config_.baseHp;
    lastSummonTurn_ = -1;
    firstSummonDone_ = false;
    effectActive_ = true;
}

}  // namespace Tactics

// Destructible per-column structure that spawns enemies and buffs them.
#pragma once

#include <string>
#include <vector>

#include "../data/GateTypes.h"
#include "GridPosition.h"

namespace Tactics {

class Gate {
public:
    Gate(int id, const GateTypeConfig& config);

    int id() const { return id_; }
    const std::string& name() const { return name_; }
    GateType type() const { return config_.type; }
    const GateTypeConfig& config() const { return config_; }
    GridPosition position() const { return GridPosition{id_, kGateRow}; }

    int currentHp() const { return currentHp_; }
    int maxHp() const { return config_.baseHp; }
    double hpRatio() const;
    bool isDestroyed() const { return currentHp_ <= 0; }

    // Clamps to [0, max]; returns the HP actually removed.
    int takeDamage(int amount);
    void onDestroyed();

    SpawnPattern pattern() const { return config_.pattern; }
    int summonInterval() const { return config_.summonInterval; }
    int lastSummonTurn() const { return lastSummonTurn_; }
    bool firstSummonDone() const { return firstSummonDone_; }
    bool canSummon(int currentTurn) const;
    int spawnCount() const;
    void onSummonExecuted(int currentTurn);

    GateEffect effect() const { return config_.effect; }
    double effectStrength() const { return config_.effectStrength; }
    bool effectActive() const { return effectActive_ && config_.effect != GateEffect::None; }

    void reset();

private:
    int id_{0};
    std::string name_;
    GateTypeConfig config_;
    int currentHp_{0};
    int lastSummonTurn_{-1};
    bool firstSummonDone_{false};
    bool effectActive_{true};
};

}  // namespace Tactics

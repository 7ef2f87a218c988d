// A live enemy occupying one grid cell.
#pragma once

#include "../../engine/status/StatusContainer.h"
#include "../data/EnemyData.h"
#include "GridPosition.h"

namespace Tactics {

class EnemyInstance {
public:
    EnemyInstance(int instanceId, const EnemyData& data);

    int instanceId() const { return instanceId_; }
    const EnemyData& data() const { return data_; }
    const GridPosition& position() const { return position_; }
    void setPosition(const GridPosition& pos) { position_ = pos; }
    int assignedGateId() const { return assignedGateId_; }
    void setAssignedGate(int gateId) { assignedGateId_ = gateId; }

    int currentHp() const { return currentHp_; }
    int maxHp() const { return data_.baseHp; }
    bool isAlive() const { return currentHp_ > 0; }

    // Applies max(1, amount - defense); returns HP removed.
    int takeDamage(int amount);
    int heal(int amount);

    int effectiveAttack() const;
    int effectiveDefense() const;

    void applyBuff(Engine::Status::EStatusId id, double multiplier, int durationTurns, int sourceId = -1);
    bool hasBuff(Engine::Status::EStatusId id) const { return status_.has(id); }
    const Engine::Status::StatusContainer& status() const { return status_; }

    bool canAct() const { return isAlive() && cooldownRemaining_ <= 0; }
    void onActed() { cooldownRemaining_ = data_.actionCooldown; }
    int turnsSinceSpawned() const { return turnsSinceSpawned_; }
    void onTurnEnd();

private:
    int instanceId_{0};
    EnemyData data_;
    GridPosition position_{GridPosition::none()};
    int assignedGateId_{-1};
    int currentHp_{0};
    int cooldownRemaining_{0};
    int turnsSinceSpawned_{0};
    Engine::Status::StatusContainer status_;
};

}  // namespace Tactics
